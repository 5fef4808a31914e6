#include <stdlib.h>
#include <memory>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/status.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "test/environment.hpp"

using namespace std;
using namespace tutor;
namespace fs = std::filesystem;

TEST(IOUtilsTest, Utf8SanitizeTest) {
    EXPECT_EQ(utf8_sanitize("hello"), "hello");
    EXPECT_EQ(utf8_sanitize("你好"), "你好");
    EXPECT_EQ(utf8_sanitize("a\xff" "b"), "a\xEF\xBF\xBD" "b");
    // 被截断的多字节字符
    EXPECT_EQ(utf8_sanitize("\xE4\xBD"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    // 代理项和过长编码都是非法的
    EXPECT_EQ(utf8_sanitize("\xED\xA0\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(utf8_sanitize("\xC0\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(utf8_sanitize("\xF0\x9F\x98\x80"), "\xF0\x9F\x98\x80");
}

TEST(IOUtilsTest, Utf8LengthTest) {
    EXPECT_EQ(utf8_length(""), 0u);
    EXPECT_EQ(utf8_length("abc"), 3u);
    EXPECT_EQ(utf8_length("你好 world"), 8u);
}

TEST(IOUtilsTest, TrimWhitespaceTest) {
    EXPECT_EQ(trim_whitespace("  a b \n\t"), "a b");
    EXPECT_EQ(trim_whitespace("\n\n"), "");
    EXPECT_EQ(trim_whitespace("line1\nline2\n"), "line1\nline2");
}

TEST(IOUtilsTest, ScopedTempFileTest) {
    fs::path path;
    {
        scoped_temp_file file(test_temp_dir(), ".py", "print('hi')\n");
        path = file.path();
        EXPECT_EQ(path.parent_path(), test_temp_dir());
        EXPECT_EQ(path.extension(), ".py");
        EXPECT_EQ(read_file_content(path), "print('hi')\n");

        scoped_temp_file other(test_temp_dir(), ".py", "");
        EXPECT_NE(other.path(), path);
    }
    EXPECT_FALSE(fs::exists(path));
    EXPECT_EQ(count_files(test_temp_dir()), 0u);
}

TEST(IOUtilsTest, ScopedTempFileRemoveTest) {
    scoped_temp_file file(test_temp_dir(), ".txt", "x");
    error_code ec;
    EXPECT_TRUE(file.remove(ec));
    EXPECT_FALSE(fs::exists(file.path()));
    // 重复删除不会失败
    EXPECT_TRUE(file.remove(ec));
}

TEST(IOUtilsTest, ScopedTempFileMissingDirectoryTest) {
    EXPECT_THROW(scoped_temp_file(test_temp_dir() / "missing", ".py", ""), temp_file_error);
}

TEST(UtilsTest, SplitLinesTest) {
    EXPECT_EQ(split_lines("a\n\nb"), (vector<string>{"a", "", "b"}));
    EXPECT_EQ(split_lines(""), vector<string>{""});
}

TEST(UtilsTest, EnvTest) {
    setenv("TUTOR_TEST_ENV", "1", 1);
    EXPECT_EQ(get_env("TUTOR_TEST_ENV", "0"), "1");
    EXPECT_EQ(get_env("TUTOR_TEST_ENV_MISSING", "0"), "0");
}

TEST(StatusTest, ParseStatusTest) {
    EXPECT_STREQ(get_display_message(status::TIME_LIMIT_EXCEEDED), "Time Limit Exceeded");
    EXPECT_EQ(parse_status("Wrong Answer"), status::WRONG_ANSWER);
    EXPECT_EQ(parse_status(get_display_message(status::CANCELLED)), status::CANCELLED);
    EXPECT_THROW(parse_status("Compilation Error"), out_of_range);
}

TEST(ExceptionTest, CategoryTest) {
    spawn_error spawn("exec failed");
    EXPECT_STREQ(spawn.what(), "exec failed");
    EXPECT_STREQ(spawn.category(), "SpawnError");

    infrastructure_error &base = spawn;
    EXPECT_STREQ(base.category(), "SpawnError");
    EXPECT_STREQ(temp_file_error().category(), "TempFileError");
    EXPECT_STREQ(collaborator_error().category(), "CollaboratorError");
}

TEST(DeferTest, RunOnScopeExitTest) {
    int count = 0;
    {
        defer { ++count; };
        defer { count *= 10; };
        EXPECT_EQ(count, 0);
    }
    // 逆序执行
    EXPECT_EQ(count, 1);
}

TEST(DeferTest, ThrowingCleanupTest) {
    bool after = false;
    EXPECT_NO_THROW({
        defer { throw runtime_error("cleanup"); };
        after = true;
    });
    EXPECT_TRUE(after);
}

TEST(ConcurrentQueueTest, CloseTest) {
    concurrent_queue<unique_ptr<int>> queue;
    EXPECT_TRUE(queue.push(make_unique<int>(1)));
    queue.close();

    auto value = make_unique<int>(2);
    EXPECT_FALSE(queue.push(move(value)));
    ASSERT_TRUE(value);  // 关闭后不会移动参数

    auto first = queue.pop();
    ASSERT_TRUE(first);
    EXPECT_EQ(**first, 1);
    EXPECT_FALSE(queue.pop());
}

TEST(ConcurrentQueueTest, WakeUpReaderTest) {
    concurrent_queue<int> queue;
    vector<int> received;
    thread reader([&] {
        while (auto value = queue.pop())
            received.push_back(*value);
    });

    for (int i = 0; i < 100; ++i)
        queue.push(int(i));
    queue.close();
    reader.join();

    ASSERT_EQ(received.size(), 100u);
    for (int i = 0; i < 100; ++i)
        EXPECT_EQ(received[i], i);
}
