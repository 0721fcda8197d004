#include "console/command.hpp"

#include <string>
#include <variant>

#include <gtest/gtest.h>

namespace nestkv::console {

// ── Helpers ───────────────────────────────────────────────────────────────────

// Unwrap a parse result that is expected to be a Command.
static Command expect_command(std::variant<Command, ErrorResp> result) {
    EXPECT_TRUE(std::holds_alternative<Command>(result))
        << "Expected Command but got ErrorResp: "
        << (std::holds_alternative<ErrorResp>(result)
                ? std::get<ErrorResp>(result).message
                : "");
    return std::get<Command>(result);
}

// Unwrap a parse result that is expected to be an ErrorResp.
static ErrorResp expect_error(std::variant<Command, ErrorResp> result) {
    EXPECT_TRUE(std::holds_alternative<ErrorResp>(result))
        << "Expected ErrorResp but got a Command";
    return std::get<ErrorResp>(result);
}

// ── parse_command: SET ────────────────────────────────────────────────────────

TEST(ParseCommand, SetKeyValue) {
    auto cmd = expect_command(parse_command("SET a 10"));
    ASSERT_TRUE(std::holds_alternative<SetCmd>(cmd));
    EXPECT_EQ(std::get<SetCmd>(cmd).key, "a");
    EXPECT_EQ(std::get<SetCmd>(cmd).value, "10");
}

TEST(ParseCommand, SetWrongArityIsError) {
    expect_error(parse_command("SET a"));
    expect_error(parse_command("SET"));
    expect_error(parse_command("SET a 1 2"));
}

// ── parse_command: GET / UNSET / NUMEQUALTO ──────────────────────────────────

TEST(ParseCommand, GetValidKey) {
    auto cmd = expect_command(parse_command("GET mykey"));
    ASSERT_TRUE(std::holds_alternative<GetCmd>(cmd));
    EXPECT_EQ(std::get<GetCmd>(cmd).key, "mykey");
}

TEST(ParseCommand, GetWrongArityIsError) {
    expect_error(parse_command("GET"));
    expect_error(parse_command("GET key extra"));
}

TEST(ParseCommand, UnsetValidKey) {
    auto cmd = expect_command(parse_command("UNSET a"));
    ASSERT_TRUE(std::holds_alternative<UnsetCmd>(cmd));
    EXPECT_EQ(std::get<UnsetCmd>(cmd).key, "a");
}

TEST(ParseCommand, NumEqualToValidValue) {
    auto cmd = expect_command(parse_command("NUMEQUALTO 10"));
    ASSERT_TRUE(std::holds_alternative<NumEqualToCmd>(cmd));
    EXPECT_EQ(std::get<NumEqualToCmd>(cmd).value, "10");
}

TEST(ParseCommand, NumEqualToWithoutValueIsError) {
    expect_error(parse_command("NUMEQUALTO"));
}

// ── parse_command: transaction verbs ──────────────────────────────────────────

TEST(ParseCommand, TransactionVerbs) {
    EXPECT_TRUE(std::holds_alternative<BeginCmd>(expect_command(parse_command("BEGIN"))));
    EXPECT_TRUE(std::holds_alternative<RollbackCmd>(expect_command(parse_command("ROLLBACK"))));
    EXPECT_TRUE(std::holds_alternative<CommitCmd>(expect_command(parse_command("COMMIT"))));
}

TEST(ParseCommand, TransactionVerbsRejectArguments) {
    expect_error(parse_command("BEGIN now"));
    expect_error(parse_command("ROLLBACK 1"));
    expect_error(parse_command("COMMIT all"));
}

TEST(ParseCommand, EndIgnoresArguments) {
    EXPECT_TRUE(std::holds_alternative<EndCmd>(expect_command(parse_command("END"))));
    EXPECT_TRUE(std::holds_alternative<EndCmd>(expect_command(parse_command("END now please"))));
}

// ── parse_command: tokenisation ───────────────────────────────────────────────

TEST(ParseCommand, VerbIsCaseInsensitive) {
    auto cmd = expect_command(parse_command("set Key Value"));
    ASSERT_TRUE(std::holds_alternative<SetCmd>(cmd));
    // Arguments keep their case.
    EXPECT_EQ(std::get<SetCmd>(cmd).key, "Key");
    EXPECT_EQ(std::get<SetCmd>(cmd).value, "Value");

    EXPECT_TRUE(std::holds_alternative<BeginCmd>(expect_command(parse_command("Begin"))));
    EXPECT_TRUE(std::holds_alternative<NumEqualToCmd>(
        expect_command(parse_command("numEqualTo 3"))));
}

TEST(ParseCommand, RunsOfWhitespaceSeparateTokens) {
    auto cmd = expect_command(parse_command("  SET \t a    1  "));
    ASSERT_TRUE(std::holds_alternative<SetCmd>(cmd));
    EXPECT_EQ(std::get<SetCmd>(cmd).key, "a");
    EXPECT_EQ(std::get<SetCmd>(cmd).value, "1");
}

TEST(ParseCommand, CRLFTolerated) {
    auto cmd = expect_command(parse_command("GET a\r"));
    ASSERT_TRUE(std::holds_alternative<GetCmd>(cmd));
    EXPECT_EQ(std::get<GetCmd>(cmd).key, "a");
}

TEST(ParseCommand, UnknownVerbIsError) {
    auto err = expect_error(parse_command("DEL a"));
    EXPECT_FALSE(err.message.empty());
}

TEST(ParseCommand, BlankLineIsError) {
    expect_error(parse_command(""));
    expect_error(parse_command("   \t"));
}

TEST(IsBlank, DetectsWhitespaceOnlyLines) {
    EXPECT_TRUE(is_blank(""));
    EXPECT_TRUE(is_blank(" \t\r"));
    EXPECT_FALSE(is_blank(" x "));
}

// ── serialize_response ────────────────────────────────────────────────────────

TEST(SerializeResponse, Silent) {
    EXPECT_EQ(serialize_response(SilentResp{}), "");
}

TEST(SerializeResponse, Value) {
    EXPECT_EQ(serialize_response(ValueResp{"10"}), "10\n");
}

TEST(SerializeResponse, Null) {
    EXPECT_EQ(serialize_response(NullResp{}), "NULL\n");
}

TEST(SerializeResponse, Count) {
    EXPECT_EQ(serialize_response(CountResp{0}), "0\n");
    EXPECT_EQ(serialize_response(CountResp{42}), "42\n");
}

TEST(SerializeResponse, NoTransaction) {
    EXPECT_EQ(serialize_response(NoTransactionResp{}), "NO TRANSACTION\n");
}

TEST(SerializeResponse, ErrorUsesFixedText) {
    EXPECT_EQ(serialize_response(ErrorResp{"unknown command: FOO"}),
              "Invalid method or number of arguments\n");
}

} // namespace nestkv::console
