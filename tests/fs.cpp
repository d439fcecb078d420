#include <filesystem>

#include <gtest/gtest.h>

#include "common.hpp"
#include "fs.hpp"
#include "path.hpp"
#include "sys.hpp"

const path::PathBuf BASE_TEST_DIR = path::PathBuf(TEST_DIR) / std::to_string(getpid());

// Define a global test environment that sets up and tears down once.
class TestEnvironment : public testing::Environment
{
public:
    void SetUp() override
    {
        std::error_code ec;
        std::cout << "[TestEnvironment] Preparing test directory: " << BASE_TEST_DIR << std::endl;

        // Remove old directory if it exists
        if (std::filesystem::exists(BASE_TEST_DIR))
        {
            std::filesystem::remove_all(BASE_TEST_DIR, ec);
            if (ec)
            {
                std::cerr << "[TestEnvironment] Warning: failed to remove old directory: " << ec.message() << std::endl;
            }
        }

        // Create a clean one
        std::filesystem::create_directories(BASE_TEST_DIR, ec);
        if (ec)
        {
            throw std::runtime_error("Failed to create test directory: " + ec.message());
        }
    }
};

// Register the global environment so it runs once per test binary
testing::Environment *const test_env = testing::AddGlobalTestEnvironment(new TestEnvironment());

class FileReadWriteData
{
public:
    path::PathBuf filename;
    std::string data;

    FileReadWriteData(path::PathBuf &&filename, std::string &&data)
        : filename(filename), data(data) {}
};

class FileReadWriteTest : public testing::TestWithParam<FileReadWriteData>
{
};

TEST_P(FileReadWriteTest, ReadWrite)
{
    const auto &param = GetParam();

    auto path = BASE_TEST_DIR / param.filename;
    std::cout << "Testing file at " << path << std::endl;

    {
        auto write_file = fs::File::create(path);
        ASSERT_TRUE(write_file.is_ok());

        std::span<const char> write_span(param.data.data(), param.data.size());

        auto write_result = write_file.unwrap().write_all(write_span);
        ASSERT_TRUE(write_result.is_ok());

        auto flush_result = write_file.unwrap().flush();
        ASSERT_TRUE(flush_result.is_ok());
    }
    // File goes out of scope and closes

    {
        auto read_file = fs::File::open(path);
        ASSERT_TRUE(read_file.is_ok());

        std::string contents = "prefix:";
        auto read_result = read_file.unwrap().read_to_string(contents);
        ASSERT_TRUE(read_result.is_ok());
        ASSERT_EQ(read_result.unwrap(), param.data.size());
        ASSERT_EQ(contents, "prefix:" + param.data);
    }

    auto whole = fs::read_to_string(path);
    ASSERT_TRUE(whole.is_ok());
    ASSERT_EQ(whole.unwrap(), param.data);
}

INSTANTIATE_TEST_SUITE_P(
    FileReadWriteVariants, // test suite name
    FileReadWriteTest,     // test fixture name
    testing::Values(
        FileReadWriteData{"FileReadWrite1.txt", "Hello World!"},
        FileReadWriteData{"FileReadWrite2.txt", "Hello Sekai! \xe4\xb8\x96\xe7\x95\x8c"},
        FileReadWriteData{"FileReadWrite3.txt", std::string(10000000, 'A')},
        FileReadWriteData{"FileReadWrite4.txt", ""}));

TEST(OpenFile, MissingFileWithContext)
{
    auto result = fs::File::open(BASE_TEST_DIR / "does-not-exist.txt").context("Could not open file");
    ASSERT_TRUE(result.is_err());

    const auto &err = result.unwrap_err();
    ASSERT_EQ(std::string(err.message()), displayed("Could not open file", err));

    auto causes = err.iter_causes();
    auto cause = causes.next();
    ASSERT_NE(cause, nullptr);
    ASSERT_STREQ(cause->message(), std::strerror(ENOENT));
    ASSERT_STREQ(cause->message(), "No such file or directory");
    ASSERT_EQ(causes.next(), nullptr);

    auto io_error = dynamic_cast<const io::Error *>(cause);
    ASSERT_NE(io_error, nullptr);
    ASSERT_EQ(io_error->kind(), io::ErrorKind::NotFound);
    ASSERT_EQ(io_error->raw_os_error(), ENOENT);
}

TEST(OpenFile, DirectoryForWriting)
{
    auto dir = BASE_TEST_DIR / "a-directory";
    std::filesystem::create_directories(dir);

    auto result = fs::File::create(dir);
    ASSERT_TRUE(result.is_err());
    ASSERT_EQ(result.unwrap_err().kind(), io::ErrorKind::IsADirectory);
}

TEST(OpenFile, CreateTruncates)
{
    auto path = BASE_TEST_DIR / "truncate.txt";
    ASSERT_TRUE(fs::write(path, "a much longer first version").is_ok());
    ASSERT_TRUE(fs::write(path, "short").is_ok());

    auto contents = fs::read_to_string(path);
    ASSERT_TRUE(contents.is_ok());
    ASSERT_EQ(contents.unwrap(), "short");
}

TEST(OpenFile, WriteIntoMissingDirectory)
{
    auto result = fs::write(BASE_TEST_DIR / "no-such-dir" / "file.txt", "x").context("Could not save file");
    ASSERT_TRUE(result.is_err());

    auto cause = dynamic_cast<const io::Error *>(result.unwrap_err().source());
    ASSERT_NE(cause, nullptr);
    ASSERT_EQ(cause->kind(), io::ErrorKind::NotFound);
}

TEST(ReadToString, RejectsInvalidUtf8)
{
    auto path = BASE_TEST_DIR / "binary.bin";
    ASSERT_TRUE(fs::write(path, std::string_view("ok\xff\xfe", 4)).is_ok());

    std::string contents = "untouched";
    auto file = fs::File::open(path);
    ASSERT_TRUE(file.is_ok());

    auto result = file.unwrap().read_to_string(contents).context("Unable to read file");
    ASSERT_TRUE(result.is_err());
    ASSERT_EQ(contents, "untouched");

    auto cause = dynamic_cast<const io::Error *>(result.unwrap_err().source());
    ASSERT_NE(cause, nullptr);
    ASSERT_EQ(cause->kind(), io::ErrorKind::InvalidData);
    ASSERT_STREQ(cause->message(), "stream did not contain valid UTF-8");
}

TEST(ReadToString, RejectsOverlongEncoding)
{
    auto path = BASE_TEST_DIR / "overlong.txt";
    ASSERT_TRUE(fs::write(path, std::string_view("\xc0\xaf", 2)).is_ok());

    auto result = fs::read_to_string(path);
    ASSERT_TRUE(result.is_err());
    ASSERT_EQ(result.unwrap_err().kind(), io::ErrorKind::InvalidData);
}

TEST(Sys, DecodeErrorKind)
{
    ASSERT_EQ(sys::decode_error_kind(ENOENT), io::ErrorKind::NotFound);
    ASSERT_EQ(sys::decode_error_kind(EACCES), io::ErrorKind::PermissionDenied);
    ASSERT_EQ(sys::decode_error_kind(EPERM), io::ErrorKind::PermissionDenied);
    ASSERT_EQ(sys::decode_error_kind(EEXIST), io::ErrorKind::AlreadyExists);
    ASSERT_EQ(sys::decode_error_kind(EAGAIN), io::ErrorKind::WouldBlock);
    ASSERT_EQ(sys::decode_error_kind(EINTR), io::ErrorKind::Interrupted);
    ASSERT_EQ(sys::decode_error_kind(EPIPE), io::ErrorKind::Other);
}

TEST(Sys, CvtReportsLastOsError)
{
    ASSERT_EQ(sys::cvt(3).unwrap(), 3);

    errno = ENOENT;
    auto failed = sys::cvt(-1);
    ASSERT_TRUE(failed.is_err());
    ASSERT_EQ(failed.unwrap_err().kind(), io::ErrorKind::NotFound);
    ASSERT_EQ(failed.unwrap_err().raw_os_error(), ENOENT);
}

TEST(Sys, CvtRetriesInterruptedCalls)
{
    int calls = 0;
    auto result = sys::cvt_r([&calls]()
                             {
                                 calls++;
                                 if (calls < 3)
                                 {
                                     errno = EINTR;
                                     return -1;
                                 }
                                 return 7; });

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.unwrap(), 7);
    ASSERT_EQ(calls, 3);

    auto denied = sys::cvt_r([]()
                             {
                                 errno = EACCES;
                                 return -1; });
    ASSERT_TRUE(denied.is_err());
    ASSERT_EQ(denied.unwrap_err().kind(), io::ErrorKind::PermissionDenied);
}

TEST(Sys, ErrorFromOsCode)
{
    auto err = io::Error::from_raw_os_error(EACCES);
    ASSERT_EQ(err.kind(), io::ErrorKind::PermissionDenied);
    ASSERT_EQ(err.raw_os_error(), EACCES);
    ASSERT_STREQ(err.message(), std::strerror(EACCES));
    ASSERT_EQ(sys::error_string(EACCES), std::strerror(EACCES));
}

TEST(IoError, CustomMessages)
{
    ASSERT_STREQ(io::Error(io::ErrorKind::UnexpectedEof).message(), "unexpected end of file");
    ASSERT_STREQ(io::Error::other("custom").message(), "custom");
    ASSERT_EQ(io::Error::other("custom").kind(), io::ErrorKind::Other);
    ASSERT_STREQ(io::format_error_kind(io::ErrorKind::NotFound), "entity not found");
}
