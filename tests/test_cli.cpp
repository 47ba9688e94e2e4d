/**
 * @file test_cli.cpp
 * @brief Tests for the saudi-id command front end
 */

#include <gtest/gtest.h>
#include <json/json.h>
#include <saudi_id/cli.h>
#include <saudi_id/national_id.h>
#include <sstream>

using namespace saudi_id;
using saudi_id::config::ToolConfig;

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.logLevel = "off";
    }

    int run(const std::vector<std::string>& args, const std::string& input = "") {
        in_.str(input);
        in_.clear();
        out_.str("");
        err_.str("");
        return cli::run(args, in_, out_, err_, config_);
    }

    static Json::Value parseJson(const std::string& text) {
        Json::CharReaderBuilder builder;
        Json::Value root;
        std::string errors;
        std::istringstream stream(text);
        EXPECT_TRUE(Json::parseFromStream(builder, stream, &root, &errors)) << errors;
        return root;
    }

    static std::vector<std::string> lines(const std::string& text) {
        std::vector<std::string> result;
        std::istringstream stream(text);
        std::string line;
        while (std::getline(stream, line)) {
            result.push_back(line);
        }
        return result;
    }

    ToolConfig config_;
    std::istringstream in_;
    std::ostringstream out_;
    std::ostringstream err_;
};

// ============================================================================
// validate
// ============================================================================

TEST_F(CliTest, Validate_AllValid) {
    EXPECT_EQ(run({"validate", "1000000008", "2234567895"}), cli::EXIT_OK);
    EXPECT_EQ(out_.str(),
              "1000000008: VALID CITIZEN\n"
              "2234567895: VALID RESIDENT\n");
}

TEST_F(CliTest, Validate_ReportsEachFailure) {
    EXPECT_EQ(run({"validate", "1000000008", "1000000009", "12345a7890"}), cli::EXIT_INVALID);
    auto output = lines(out_.str());
    ASSERT_EQ(output.size(), 3u);
    EXPECT_EQ(output[0], "1000000008: VALID CITIZEN");
    EXPECT_EQ(output[1].find("1000000009: INVALID CHECKSUM_MISMATCH"), 0u);
    EXPECT_EQ(output[2].find("12345a7890: INVALID NON_DIGIT"), 0u);
}

TEST_F(CliTest, Validate_StdinTrimsAndSkipsBlankLines) {
    EXPECT_EQ(run({"validate", "-"}, "  1581872353 \n\n1564437091\r\n"), cli::EXIT_OK);
    auto output = lines(out_.str());
    ASSERT_EQ(output.size(), 2u);
    EXPECT_EQ(output[0], "1581872353: VALID CITIZEN");
    EXPECT_EQ(output[1], "1564437091: VALID CITIZEN");
}

TEST_F(CliTest, Validate_Json) {
    EXPECT_EQ(run({"--json", "validate", "1000000008", "3000000004"}), cli::EXIT_INVALID);
    Json::Value root = parseJson(out_.str());
    ASSERT_TRUE(root.isArray());
    ASSERT_EQ(root.size(), 2u);

    EXPECT_EQ(root[0]["input"].asString(), "1000000008");
    EXPECT_TRUE(root[0]["valid"].asBool());
    EXPECT_EQ(root[0]["category"].asString(), "CITIZEN");

    EXPECT_FALSE(root[1]["valid"].asBool());
    EXPECT_EQ(root[1]["error"]["code"].asString(), "INVALID_CATEGORY");
    EXPECT_FALSE(root[1]["error"]["message"].asString().empty());
}

TEST_F(CliTest, Validate_JsonFromConfig) {
    config_.outputFormat = "json";
    EXPECT_EQ(run({"validate", "2000000006"}), cli::EXIT_OK);
    Json::Value root = parseJson(out_.str());
    ASSERT_EQ(root.size(), 1u);
    EXPECT_EQ(root[0]["category"].asString(), "RESIDENT");
}

TEST_F(CliTest, Validate_NoOperandsIsUsageError) {
    EXPECT_EQ(run({"validate"}), cli::EXIT_USAGE);
    EXPECT_NE(err_.str().find("usage:"), std::string::npos);
}

// ============================================================================
// generate
// ============================================================================

TEST_F(CliTest, Generate_SeededIsDeterministic) {
    EXPECT_EQ(run({"generate", "--count", "3", "--seed", "42"}), cli::EXIT_OK);
    std::string first = out_.str();
    EXPECT_EQ(run({"generate", "--count", "3", "--seed", "42"}), cli::EXIT_OK);
    EXPECT_EQ(out_.str(), first);

    auto output = lines(first);
    ASSERT_EQ(output.size(), 3u);
    for (const auto& line : output) {
        ParseResult parsed = NationalId::parse(line);
        ASSERT_TRUE(parsed.ok()) << line;
        EXPECT_TRUE(parsed.id->isCitizen());
    }
}

TEST_F(CliTest, Generate_ResidentJson) {
    EXPECT_EQ(run({"generate", "--type", "resident", "--count", "5", "--json"}), cli::EXIT_OK);
    Json::Value root = parseJson(out_.str());
    EXPECT_EQ(root["category"].asString(), "RESIDENT");
    ASSERT_EQ(root["ids"].size(), 5u);
    for (const auto& id : root["ids"]) {
        ParseResult parsed = NationalId::parse(id.asString());
        ASSERT_TRUE(parsed.ok());
        EXPECT_TRUE(parsed.id->isResident());
    }
    EXPECT_FALSE(root.isMember("error"));
}

TEST_F(CliTest, Generate_SeededSourceFromConfig) {
    config_.randomSource = "seeded";
    config_.seed = 7;
    EXPECT_EQ(run({"generate", "--count", "2"}), cli::EXIT_OK);
    std::string fromConfig = out_.str();

    config_ = ToolConfig{};
    config_.logLevel = "off";
    EXPECT_EQ(run({"generate", "--count", "2", "--seed", "7"}), cli::EXIT_OK);
    EXPECT_EQ(out_.str(), fromConfig);
}

TEST_F(CliTest, Generate_CountOutOfRange) {
    EXPECT_EQ(run({"generate", "--count", "0"}), cli::EXIT_USAGE);

    config_.maxCount = 10;
    EXPECT_EQ(run({"generate", "--count", "11"}), cli::EXIT_USAGE);
    EXPECT_EQ(run({"generate", "--count", "10", "--seed", "1"}), cli::EXIT_OK);
    EXPECT_EQ(lines(out_.str()).size(), 10u);
}

TEST_F(CliTest, Generate_BadArguments) {
    EXPECT_EQ(run({"generate", "--count", "three"}), cli::EXIT_USAGE);
    EXPECT_EQ(run({"generate", "--type", "visitor"}), cli::EXIT_USAGE);
    EXPECT_EQ(run({"generate", "--seed", "-1"}), cli::EXIT_USAGE);
    EXPECT_EQ(run({"generate", "--count"}), cli::EXIT_USAGE);
    EXPECT_EQ(run({"generate", "extra"}), cli::EXIT_USAGE);
}

// ============================================================================
// check-digit
// ============================================================================

TEST_F(CliTest, CheckDigit_Text) {
    EXPECT_EQ(run({"check-digit", "100000000"}), cli::EXIT_OK);
    EXPECT_EQ(out_.str(), "1000000008\n");
}

TEST_F(CliTest, CheckDigit_Json) {
    EXPECT_EQ(run({"check-digit", "--json", "158187235"}), cli::EXIT_OK);
    Json::Value root = parseJson(out_.str());
    EXPECT_EQ(root["id"].asString(), "1581872353");
    EXPECT_EQ(root["payload"].asString(), "158187235");
    EXPECT_EQ(root["checkDigit"].asInt(), 3);
    EXPECT_EQ(root["category"].asString(), "CITIZEN");
}

TEST_F(CliTest, CheckDigit_InvalidCategory) {
    EXPECT_EQ(run({"check-digit", "300000000"}), cli::EXIT_INVALID);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_NE(err_.str().find("error:"), std::string::npos);

    EXPECT_EQ(run({"--json", "check-digit", "000000000"}), cli::EXIT_INVALID);
    Json::Value root = parseJson(out_.str());
    EXPECT_EQ(root["payload"].asString(), "000000000");
    EXPECT_EQ(root["error"]["code"].asString(), "INVALID_CATEGORY");
    EXPECT_FALSE(root.isMember("id"));
}

TEST_F(CliTest, CheckDigit_BadPayload) {
    EXPECT_EQ(run({"check-digit", "12345678"}), cli::EXIT_USAGE);
    EXPECT_EQ(run({"check-digit", "1234567890"}), cli::EXIT_USAGE);
    EXPECT_EQ(run({"check-digit", "12345678a"}), cli::EXIT_USAGE);
    EXPECT_EQ(run({"check-digit"}), cli::EXIT_USAGE);
}

// ============================================================================
// Dispatch and configuration
// ============================================================================

TEST_F(CliTest, Help) {
    EXPECT_EQ(run({"--help"}), cli::EXIT_OK);
    EXPECT_NE(out_.str().find("usage:"), std::string::npos);

    EXPECT_EQ(run({"help"}), cli::EXIT_OK);
    EXPECT_NE(out_.str().find("check-digit"), std::string::npos);
}

TEST_F(CliTest, NoArguments) {
    EXPECT_EQ(run({}), cli::EXIT_USAGE);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_NE(err_.str().find("usage:"), std::string::npos);
}

TEST_F(CliTest, UnknownCommandAndOption) {
    EXPECT_EQ(run({"issue"}), cli::EXIT_USAGE);
    EXPECT_NE(err_.str().find("unknown command 'issue'"), std::string::npos);

    EXPECT_EQ(run({"validate", "--strict", "1000000008"}), cli::EXIT_USAGE);
    EXPECT_NE(err_.str().find("unknown option --strict"), std::string::npos);
}

TEST_F(CliTest, InvalidConfiguration) {
    config_.randomSource = "urandom";
    EXPECT_EQ(run({"generate"}), cli::EXIT_USAGE);
    EXPECT_NE(err_.str().find("SAUDI_ID_RANDOM_SOURCE"), std::string::npos);

    config_ = ToolConfig{};
    EXPECT_EQ(run({"--log-level", "loud", "validate", "1000000008"}), cli::EXIT_USAGE);
}
