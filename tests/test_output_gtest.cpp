// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================
//
// output: уровни диагностики, quiet/verbose, JSON Lines в файл событий,
// лог-файл агента
//
// ==============================================================================

#include <enrollwatch/output.hpp>
#include <enrollwatch/platform.hpp>

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace enrollwatch::output::test {

class OutputFileTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("enrollwatch_output_") + test_info->name() + "_" +
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

    static std::vector<std::string> read_lines(const std::filesystem::path& p) {
        std::ifstream in(p);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }
};

// ==============================================================================
// Создание и уровни
// ==============================================================================

TEST(OutputTest, Writer_DefaultConfig_CreatesSuccessfully) {
    OutputConfig config;
    EXPECT_NO_THROW({ Writer writer(config); });
}

TEST(OutputTest, Writer_AllLevels_DoNotThrow) {
    OutputConfig config;
    config.verbose = 2;
    Writer writer(config);

    EXPECT_NO_THROW({
        writer.info("info");
        writer.warn("warn");
        writer.error("error");
        writer.debug("debug");
        writer.trace("trace");
    });
}

TEST(OutputTest, Writer_HasOutputFile_FalseByDefault) {
    OutputConfig config;
    Writer writer(config);
    EXPECT_FALSE(writer.has_output_file());
    EXPECT_FALSE(writer.has_log_file());
}

TEST(OutputTest, AnsiColorCode_DefaultIsEmpty) {
    EXPECT_TRUE(ansi_color_code(Color::Default).empty());
    EXPECT_FALSE(ansi_color_code(Color::Red).empty());
    EXPECT_FALSE(ansi_reset_code().empty());
}

// ==============================================================================
// Файл событий (JSON Lines)
// ==============================================================================

TEST_F(OutputFileTest, WriteJsonLine_GoesToOutputFile) {
    // Arrange
    OutputConfig config;
    config.output_path = test_dir_ / "events" / "events.jsonl";

    rapidjson::Document doc;
    doc.SetObject();
    doc.AddMember("eventType", "esp_phase_changed", doc.GetAllocator());
    doc.AddMember("sequence", 3, doc.GetAllocator());

    // Act
    {
        Writer writer(config);
        ASSERT_TRUE(writer.has_output_file());
        writer.write_json_line(doc);
        writer.write_json_line(doc);
    }

    // Assert
    auto lines = read_lines(*config.output_path);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], R"({"eventType":"esp_phase_changed","sequence":3})");
}

TEST_F(OutputFileTest, OutputFile_AppendsAcrossRestarts) {
    OutputConfig config;
    config.output_path = test_dir_ / "events.jsonl";
    config.append = true;

    rapidjson::Document doc;
    doc.SetObject();
    doc.AddMember("n", 1, doc.GetAllocator());

    {
        Writer writer(config);
        writer.write_json_line(doc);
    }
    {
        Writer writer(config);
        writer.write_json_line(doc);
    }

    EXPECT_EQ(read_lines(*config.output_path).size(), 2u);
}

TEST_F(OutputFileTest, OutputFile_TruncatesWithoutAppend) {
    OutputConfig config;
    config.output_path = test_dir_ / "events.jsonl";
    config.append = false;

    rapidjson::Document doc;
    doc.SetObject();

    {
        Writer writer(config);
        writer.write_json_line(doc);
    }
    {
        Writer writer(config);
        writer.write_json_line(doc);
    }

    EXPECT_EQ(read_lines(*config.output_path).size(), 1u);
}

// ==============================================================================
// Лог-файл агента
// ==============================================================================

TEST_F(OutputFileTest, LogFile_ReceivesDiagnosticsEvenWhenQuiet) {
    // Arrange
    OutputConfig config;
    config.quiet = true;
    config.log_path = test_dir_ / "agent.log";

    // Act
    {
        Writer writer(config);
        ASSERT_TRUE(writer.has_log_file());
        writer.info("tracker started");
        writer.warn("snapshot unreadable");
        writer.debug("not written: verbose = 0");
    }

    // Assert
    auto lines = read_lines(*config.log_path);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("[+] tracker started"), std::string::npos);
    EXPECT_NE(lines[1].find("[!] snapshot unreadable"), std::string::npos);
    EXPECT_EQ(lines[0].find('\x1b'), std::string::npos);
}

TEST_F(OutputFileTest, ConcurrentWriters_ProduceWholeLines) {
    // Arrange
    OutputConfig config;
    config.output_path = test_dir_ / "events.jsonl";
    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;

    // Act
    {
        Writer writer(config);
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&writer, t] {
                for (int i = 0; i < kPerThread; ++i) {
                    rapidjson::Document doc;
                    doc.SetObject();
                    doc.AddMember("thread", t, doc.GetAllocator());
                    doc.AddMember("i", i, doc.GetAllocator());
                    writer.write_json_line(doc);
                }
            });
        }
        for (auto& th : threads) {
            th.join();
        }
    }

    // Assert
    auto lines = read_lines(*config.output_path);
    ASSERT_EQ(lines.size(), static_cast<size_t>(kThreads * kPerThread));
    for (const auto& line : lines) {
        rapidjson::Document doc;
        doc.Parse(line.c_str());
        EXPECT_FALSE(doc.HasParseError()) << line;
    }
}

}  // namespace enrollwatch::output::test
