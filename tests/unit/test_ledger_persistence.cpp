#include <catch2/catch_test_macros.hpp>
#include "msghistory/history/message_ledger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>

using namespace msghistory::history;

namespace {

MessageLedger sample_ledger() {
    MessageLedger ledger;
    REQUIRE(ledger.add(Message::system("You are a browsing agent."), MessageMetadata{12, "system"}).is_ok());

    auto state = Message::human("Current url: https://example.com");
    state.images.push_back(ImageContent{"aGVsbG8=", "image/png"});
    REQUIRE(ledger.add(std::move(state), MessageMetadata{40, "state"}).is_ok());

    ledger.add_agent_turn(Json{{"action", Json::array({Json{{"click_element", {{"index", 4}}}}})}});
    return ledger;
}

fs::path temp_file(const std::string& name) {
    auto dir = fs::temp_directory_path() / "msghistory_persistence_tests";
    fs::create_directories(dir);
    return dir / name;
}

}  // namespace

TEST_CASE("Snapshot layout", "[persistence]") {
    auto j = sample_ledger().to_json();

    REQUIRE(j["current_tokens"] == 162);
    REQUIRE(j["tool_id"] == 2);
    REQUIRE(j["messages"].size() == 4);
    REQUIRE(j["messages"][0]["message"]["role"] == "system");
    REQUIRE(j["messages"][0]["metadata"]["tokens"] == 12);
    REQUIRE(j["messages"][0]["metadata"]["message_type"] == "system");
    REQUIRE(j["messages"][3]["message"]["tool_call_id"] == "1");
}

TEST_CASE("Snapshot round trip keeps entries and totals", "[persistence]") {
    auto ledger = sample_ledger();

    auto restored = MessageLedger::from_json(ledger.to_json());
    REQUIRE(restored.is_ok());
    REQUIRE(restored.value().size() == ledger.size());
    REQUIRE(restored.value().total_tokens() == ledger.total_tokens());
    REQUIRE(restored.value().next_tool_id() == ledger.next_tool_id());
    REQUIRE(restored.value().to_json() == ledger.to_json());

    // The id counter carries over, so the next turn does not reuse "1"
    REQUIRE(restored.value().add_agent_turn(Json::object()) == "2");
}

TEST_CASE("Snapshot with wrong current_tokens is rejected", "[persistence]") {
    auto j = sample_ledger().to_json();
    j["current_tokens"] = 999;

    auto result = MessageLedger::from_json(j);
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::MalformedState);
}

TEST_CASE("Malformed snapshots are rejected", "[persistence]") {
    SECTION("missing messages") {
        REQUIRE(MessageLedger::from_json(Json{{"current_tokens", 0}}).is_err());
    }
    SECTION("missing current_tokens") {
        REQUIRE(MessageLedger::from_json(Json{{"messages", Json::array()}}).is_err());
    }
    SECTION("negative token cost") {
        auto j = sample_ledger().to_json();
        j["messages"][1]["metadata"]["tokens"] = -40;
        j["current_tokens"] = 82;
        auto result = MessageLedger::from_json(j);
        REQUIRE(result.is_err());
        REQUIRE(result.error().context == "messages[1]");
    }
    SECTION("unknown role") {
        auto j = sample_ledger().to_json();
        j["messages"][2]["message"]["role"] = "assistant";
        REQUIRE(MessageLedger::from_json(j).is_err());
    }
    SECTION("non-integer tokens") {
        auto j = sample_ledger().to_json();
        j["messages"][0]["metadata"]["tokens"] = "12";
        REQUIRE(MessageLedger::from_json(j).is_err());
    }
    SECTION("bad tool id") {
        auto j = sample_ledger().to_json();
        j["tool_id"] = 0;
        REQUIRE(MessageLedger::from_json(j).is_err());
    }
}

TEST_CASE("Snapshot values outside the int range are rejected", "[persistence]") {
    constexpr int kMax = std::numeric_limits<int>::max();

    SECTION("oversized token cost is not truncated") {
        // 2^32 + 5 would narrow to 5 and match current_tokens
        auto j = sample_ledger().to_json();
        j["messages"][0]["metadata"]["tokens"] = int64_t{4294967301};
        j["current_tokens"] = 155;
        auto result = MessageLedger::from_json(j);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == ErrorCode::MalformedState);
        REQUIRE(result.error().context == "messages[0]");
    }
    SECTION("token sum past INT_MAX") {
        auto j = sample_ledger().to_json();
        j["messages"][0]["metadata"]["tokens"] = kMax;
        j["messages"][1]["metadata"]["tokens"] = kMax;
        j["current_tokens"] = int64_t{kMax} * 2 + 110;
        auto result = MessageLedger::from_json(j);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == ErrorCode::MalformedState);
        REQUIRE(result.error().context == "messages[1]");
    }
    SECTION("oversized current_tokens") {
        auto j = sample_ledger().to_json();
        j["current_tokens"] = int64_t{162} + (int64_t{1} << 32);
        REQUIRE(MessageLedger::from_json(j).is_err());
    }
    SECTION("oversized tool_id") {
        auto j = sample_ledger().to_json();
        j["tool_id"] = int64_t{1} << 32;
        auto result = MessageLedger::from_json(j);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == ErrorCode::MalformedState);
    }
    SECTION("largest token cost still loads") {
        MessageLedger ledger;
        REQUIRE(ledger.add(Message::human("huge"), MessageMetadata{kMax, "state"}).is_ok());
        auto restored = MessageLedger::from_json(ledger.to_json());
        REQUIRE(restored.is_ok());
        REQUIRE(restored.value().total_tokens() == kMax);
    }
}

TEST_CASE("Oversized token cost in a file is rejected", "[persistence]") {
    auto path = temp_file("oversized.json");
    {
        std::ofstream out(path);
        out << R"({"messages": [{"message": {"role": "human", "content": "a"},)"
               R"( "metadata": {"tokens": 4294967301, "message_type": null}}],)"
               R"( "current_tokens": 5, "tool_id": 1})";
    }

    auto loaded = MessageLedger::load(path);
    REQUIRE(loaded.is_err());
    REQUIRE(loaded.error().code == ErrorCode::MalformedState);
}

TEST_CASE("Snapshot without tool_id starts the counter at 1", "[persistence]") {
    auto j = sample_ledger().to_json();
    j.erase("tool_id");

    auto restored = MessageLedger::from_json(j);
    REQUIRE(restored.is_ok());
    REQUIRE(restored.value().next_tool_id() == 1);
}

TEST_CASE("Ledger save and load through a file", "[persistence]") {
    auto ledger = sample_ledger();
    auto path = temp_file("ledger.json");

    REQUIRE(ledger.save(path).is_ok());

    auto loaded = MessageLedger::load(path);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().to_json() == ledger.to_json());
}

TEST_CASE("Ledger load errors", "[persistence]") {
    auto missing = MessageLedger::load(temp_file("missing.json"));
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == ErrorCode::FileNotFound);

    auto path = temp_file("garbage.json");
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    auto garbage = MessageLedger::load(path);
    REQUIRE(garbage.is_err());
    REQUIRE(garbage.error().code == ErrorCode::MalformedState);
}
