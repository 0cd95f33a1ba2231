#include <gtest/gtest.h>
#include "security/Validator.hpp"
#include "security/VirusScanner.hpp"
#include "files/errors.hpp"

#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using namespace fk::security;
using fk::files::ValidationError;
using nlohmann::json;

TEST(ValidatorTest, SanitizeStripsControlCharsAndTrims) {
    const DefaultValidator v;
    EXPECT_EQ(v.sanitizeInput("  report.pdf \n"), "report.pdf");
    EXPECT_EQ(v.sanitizeInput(std::string("a\0b\x01" "c\x7f", 6)), "abc");
    EXPECT_EQ(v.sanitizeInput("line1\tline2\nline3"), "line1\tline2\nline3");
    EXPECT_EQ(v.sanitizeInput(" \t\n"), "");
}

TEST(ValidatorTest, SanitizeCapsLength) {
    const DefaultValidator v;
    const std::string big(DefaultValidator::MAX_INPUT_LENGTH + 50, 'a');
    EXPECT_EQ(v.sanitizeInput(big).size(), DefaultValidator::MAX_INPUT_LENGTH);
}

TEST(ValidatorTest, MaliciousFilenames) {
    const DefaultValidator v;
    EXPECT_FALSE(v.containsMaliciousContent("holiday photo (1).jpg"));
    EXPECT_TRUE(v.containsMaliciousContent("../etc/passwd"));
    EXPECT_TRUE(v.containsMaliciousContent("dir/file.txt"));
    EXPECT_TRUE(v.containsMaliciousContent("C:\\boot.ini"));
    EXPECT_TRUE(v.containsMaliciousContent("<script>alert(1)</script>.html"));
    EXPECT_TRUE(v.containsMaliciousContent("what?.txt"));
    EXPECT_TRUE(v.containsMaliciousContent("x onerror=boom"));
}

TEST(ValidatorTest, ScriptPatternsAreCaseInsensitive) {
    EXPECT_TRUE(containsScriptPattern("JavaScript:void(0)"));
    EXPECT_TRUE(containsScriptPattern("<SCRIPT src=x>"));
    EXPECT_FALSE(containsScriptPattern("a perfectly boring description"));
}

TEST(ValidatorTest, RequestBodyAcceptsPlainMetadata) {
    const DefaultValidator v;
    EXPECT_NO_THROW(v.validateRequestBody(json::object()));
    EXPECT_NO_THROW(v.validateRequestBody({{"camera", "X100"}, {"iso", 200}, {"tags", {"a", "b"}},
                                           {"nested", {{"k", "v"}}}}));
}

TEST(ValidatorTest, RequestBodyRejectsScriptsAndShape) {
    const DefaultValidator v;
    EXPECT_THROW(v.validateRequestBody(json::array()), ValidationError);
    EXPECT_THROW(v.validateRequestBody({{"desc", "<script>x</script>"}}), ValidationError);
    EXPECT_THROW(v.validateRequestBody({{"onclick=", "x"}}), ValidationError);
    EXPECT_THROW(v.validateRequestBody({{"list", {"ok", "javascript:alert(1)"}}}), ValidationError);
    EXPECT_THROW(v.validateRequestBody({{std::string(300, 'k'), 1}}), ValidationError);
}

TEST(ValidatorTest, RequestBodyDepthLimit) {
    const DefaultValidator v;
    json deep = "leaf";
    for (size_t i = 0; i < DefaultValidator::MAX_BODY_DEPTH + 2; ++i) deep = json{{"k", deep}};
    EXPECT_THROW(v.validateRequestBody(deep), ValidationError);
}

TEST(ValidatorTest, RequestBodyKeyLimit) {
    const DefaultValidator v;
    json body = json::object();
    for (size_t i = 0; i <= DefaultValidator::MAX_BODY_KEYS; ++i) body["k" + std::to_string(i)] = i;
    EXPECT_THROW(v.validateRequestBody(body), ValidationError);
}

TEST(SignatureScannerTest, CleanStream) {
    SignatureScanner scanner;
    std::istringstream in("just some ordinary text\n");
    const auto report = scanner.scan(in);
    EXPECT_TRUE(report.clean);
    EXPECT_TRUE(report.threats.empty());
}

TEST(SignatureScannerTest, FindsEicar) {
    SignatureScanner scanner;
    std::istringstream in(std::string("prefix ") + SignatureScanner::EICAR + " suffix");
    const auto report = scanner.scan(in);
    EXPECT_FALSE(report.clean);
    ASSERT_EQ(report.threats.size(), 1u);
    EXPECT_EQ(report.threats[0], "EICAR-Test-File");
}

TEST(SignatureScannerTest, FindsSignatureAcrossChunkBoundary) {
    SignatureScanner scanner(std::vector<std::string>{}, 16);
    // Place the marker so it straddles several 16-byte chunks.
    std::istringstream in(std::string(13, '.') + SignatureScanner::EICAR + std::string(40, '.'));
    EXPECT_FALSE(scanner.scan(in).clean);
}

TEST(SignatureScannerTest, HexSignatures) {
    SignatureScanner scanner(std::vector<std::string>{"4D5A90"}, 2);
    EXPECT_EQ(scanner.signatureCount(), 2u);

    std::istringstream in(std::string("ab\x4d\x5a\x90", 5) + "cd");
    const auto report = scanner.scan(in);
    ASSERT_EQ(report.threats.size(), 1u);
    EXPECT_EQ(report.threats[0], "sig:4d5a90");
}

TEST(SignatureScannerTest, RejectsBadConfiguration) {
    using Sigs = std::vector<std::string>;
    EXPECT_THROW(SignatureScanner(Sigs{"abc"}), std::invalid_argument);
    EXPECT_THROW(SignatureScanner(Sigs{"zz"}), std::invalid_argument);
    EXPECT_THROW(SignatureScanner(Sigs{}, 0), std::invalid_argument);
}

TEST(SignatureScannerTest, ThreatMessageListsEveryName) {
    const fk::files::ThreatDetected e({"EICAR-Test-File", "sig:4d5a90"});
    EXPECT_STREQ(e.what(), "Threat detected: EICAR-Test-File, sig:4d5a90");
    EXPECT_EQ(e.threats.size(), 2u);
}
