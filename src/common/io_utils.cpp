#include "common/io_utils.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include "common/exceptions.hpp"

namespace tutor {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

/**
 * @brief 计算从 i 开始的合法 UTF-8 序列的长度
 * @return 序列的字节数，若不合法返回 0
 */
static size_t utf8_sequence_length(const string &s, size_t i) {
    unsigned char c = s[i];
    size_t n;
    if (c <= 0x7f)
        return 1;  // 0bbbbbbb
    else if ((c & 0xE0) == 0xC0)
        n = 2;  // 110bbbbb
    else if ((c & 0xF0) == 0xE0)
        n = 3;  // 1110bbbb
    else if ((c & 0xF8) == 0xF0)
        n = 4;  // 11110bbb
    else
        return 0;

    if (i + n > s.size()) return 0;
    for (size_t j = 1; j < n; ++j)
        if (((unsigned char)s[i + j] & 0xC0) != 0x80) return 0;

    // 过长编码（比如 0xC0 0x80）
    if (n == 2 && c < 0xC2) return 0;
    if (n == 3 && c == 0xE0 && (unsigned char)s[i + 1] < 0xA0) return 0;
    if (n == 4 && c == 0xF0 && (unsigned char)s[i + 1] < 0x90) return 0;
    // U+D800 到 U+DFFF 的代理项
    if (n == 3 && c == 0xED && (unsigned char)s[i + 1] >= 0xA0) return 0;
    // 超过 U+10FFFF
    if (n == 4 && (c > 0xF4 || (c == 0xF4 && (unsigned char)s[i + 1] >= 0x90))) return 0;
    return n;
}

string utf8_sanitize(const string &bytes) {
    static const char replacement[] = "\xEF\xBF\xBD";  // U+FFFD
    string result;
    result.reserve(bytes.size());
    for (size_t i = 0; i < bytes.size();) {
        size_t n = utf8_sequence_length(bytes, i);
        if (n == 0) {
            result += replacement;
            ++i;
        } else {
            result.append(bytes, i, n);
            i += n;
        }
    }
    return result;
}

size_t utf8_length(const string &str) {
    size_t length = 0;
    for (unsigned char c : str)
        if ((c & 0xC0) != 0x80) ++length;
    return length;
}

string trim_whitespace(const string &str) {
    return boost::algorithm::trim_copy(str);
}

scoped_temp_file::scoped_temp_file(const fs::path &dir, const string &suffix, const string &content)
    : valid(false) {
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    file = dir / ("submission-" + uuid + suffix);

    int fd = open(file.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0)
        throw temp_file_error("unable to create " + file.string() + ": " + strerror(errno));
    valid = true;

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close(fd);
            error_code ec;
            remove(ec);
            throw temp_file_error("unable to write " + file.string() + ": " + strerror(err));
        }
        written += n;
    }

    if (close(fd) != 0) {
        int err = errno;
        error_code ec;
        remove(ec);
        throw temp_file_error("unable to close " + file.string() + ": " + strerror(err));
    }

    DLOG(INFO) << "Created temp file " << file;
}

scoped_temp_file::scoped_temp_file(scoped_temp_file &&other) noexcept
    : file(move(other.file)), valid(other.valid) {
    other.valid = false;
}

scoped_temp_file::~scoped_temp_file() {
    error_code ec;
    if (!remove(ec))
        LOG(WARNING) << "Unable to remove temp file " << file << ": " << ec.message();
}

const fs::path &scoped_temp_file::path() const {
    return file;
}

bool scoped_temp_file::remove(error_code &ec) noexcept {
    if (!valid) return true;
    fs::remove(file, ec);
    if (ec) return false;
    valid = false;
    DLOG(INFO) << "Removed temp file " << file;
    return true;
}

}  // namespace tutor
