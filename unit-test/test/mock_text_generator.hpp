#pragma once

#include <string>
#include "feedback/text_generator.hpp"
#include "gmock/gmock.h"

namespace tutor {

class mock_text_generator : public text_generator {
public:
    MOCK_METHOD(std::string, generate, (const std::string &prompt), (override));
};

}  // namespace tutor
