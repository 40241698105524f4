// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного модуля (GoogleTest)
// ==============================================================================
//
// platform: пути UTF-8, TTY, раскрытие %VAR%, атомарная запись, temp-файлы
//
// ==============================================================================

#include <enrollwatch/platform.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace enrollwatch::platform::test {

namespace {

std::string read_all(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void set_env(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

}  // namespace

// ==============================================================================
// Идентификация платформы
// ==============================================================================

TEST(PlatformTest, OsName_ReturnsKnownName) {
    std::string name = os_name();
    EXPECT_TRUE(name == "Windows" || name == "Linux" || name == "macOS");
}

// ==============================================================================
// Преобразование путей UTF-8 <-> path
// ==============================================================================

TEST(PlatformTest, PathFromUtf8_BasicPath) {
    // Arrange
    std::string utf8 = "Logs/IntuneManagementExtension.log";

    // Act
    std::filesystem::path p = path_from_utf8(utf8);

    // Assert
    EXPECT_EQ(p.filename(), "IntuneManagementExtension.log");
}

TEST(PlatformTest, PathConversion_RoundtripWithCyrillic) {
    // Arrange
    std::string utf8 = "журналы/агент.log";

    // Act
    std::string back = path_to_utf8(path_from_utf8(utf8));

    // Assert
    EXPECT_EQ(back, utf8);
}

TEST(PlatformTest, PathToUtf8_EmptyPath) {
    EXPECT_TRUE(path_to_utf8(std::filesystem::path()).empty());
}

// ==============================================================================
// TTY detection
// ==============================================================================

TEST(PlatformTest, IsTty_DoesNotThrow) {
    EXPECT_NO_THROW({
        (void)is_tty_stdout();
        (void)is_tty_stderr();
    });
}

// ==============================================================================
// Раскрытие переменных окружения
// ==============================================================================

TEST(PlatformTest, ExpandEnvironment_KnownVariable) {
    // Arrange
    set_env("ENROLLWATCH_TEST_ROOT", "C:\\ProgramData");

    // Act
    std::string expanded = expand_environment("%ENROLLWATCH_TEST_ROOT%\\Microsoft\\Logs");

    // Assert
    EXPECT_EQ(expanded, "C:\\ProgramData\\Microsoft\\Logs");
}

TEST(PlatformTest, ExpandEnvironment_UnknownVariableKept) {
    std::string expanded = expand_environment("%ENROLLWATCH_SURELY_UNSET_VAR%\\x");
    EXPECT_EQ(expanded, "%ENROLLWATCH_SURELY_UNSET_VAR%\\x");
}

TEST(PlatformTest, ExpandEnvironment_NoReferences) {
    EXPECT_EQ(expand_environment("plain/path"), "plain/path");
    EXPECT_EQ(expand_environment("100%"), "100%");
}

// ==============================================================================
// Атомарная запись и временные файлы
// ==============================================================================

class AtomicWriteTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("enrollwatch_platform_") + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );
        test_dir_ = std::filesystem::temp_directory_path() / unique_name;
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }
};

TEST_F(AtomicWriteTest, WriteFileAtomic_CreatesFile) {
    // Arrange
    auto target = test_dir_ / "state.json";

    // Act
    write_file_atomic(target, "{\"version\":1}");

    // Assert
    EXPECT_EQ(read_all(target), "{\"version\":1}");
}

TEST_F(AtomicWriteTest, WriteFileAtomic_ReplacesContentWithoutLeftovers) {
    // Arrange
    auto target = test_dir_ / "state.json";
    write_file_atomic(target, "old content that is longer");

    // Act
    write_file_atomic(target, "new");

    // Assert
    EXPECT_EQ(read_all(target), "new");
    std::size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(test_dir_)) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(AtomicWriteTest, WriteFileAtomic_MissingDirectoryThrows) {
    auto target = test_dir_ / "no" / "such" / "dir" / "state.json";
    EXPECT_THROW(write_file_atomic(target, "x"), std::runtime_error);
}

}  // namespace enrollwatch::platform::test
