#include <gtest/gtest.h>

#include "result_record.h"

TEST(ResultRecord, Ok) {
  auto rec = ParseResultRecord(R"({"status": "ok", "result": {"a": [1, 2.5, null]}})", false);
  ASSERT_EQ(rec.status, RecordStatus::OK);
  EXPECT_EQ(rec.result, nlohmann::json::parse(R"({"a": [1, 2.5, null]})"));
}

TEST(ResultRecord, OkNullResult) {
  auto rec = ParseResultRecord(R"({"status": "ok", "result": null})", false);
  ASSERT_EQ(rec.status, RecordStatus::OK);
  EXPECT_TRUE(rec.result.is_null());
}

TEST(ResultRecord, ContractStatuses) {
  auto rec = ParseResultRecord(R"({"status": "missing_entry_point"})", false);
  EXPECT_EQ(rec.status, RecordStatus::MISSING_ENTRY_POINT);
  EXPECT_TRUE(rec.IsContractViolation());
  EXPECT_EQ(rec.ContractReason(), "script must define a main() function");

  rec = ParseResultRecord(R"({"status": "bad_signature"})", false);
  EXPECT_EQ(rec.status, RecordStatus::BAD_SIGNATURE);
  EXPECT_TRUE(rec.IsContractViolation());

  rec = ParseResultRecord(R"({"status": "not_serializable", "type": "set"})", false);
  EXPECT_EQ(rec.status, RecordStatus::NOT_SERIALIZABLE);
  EXPECT_TRUE(rec.IsContractViolation());
  EXPECT_EQ(rec.ContractReason(), "main() must return a JSON-serializable value, got set");
}

TEST(ResultRecord, Error) {
  auto rec = ParseResultRecord(
      R"({"status": "error", "type": "ValueError", "message": "x",)"
      R"( "trace": "  File \"<script>\", line 2, in main\n"})", false);
  ASSERT_EQ(rec.status, RecordStatus::ERROR);
  EXPECT_FALSE(rec.IsContractViolation());
  EXPECT_EQ(rec.type, "ValueError");
  EXPECT_EQ(rec.message, "x");
  EXPECT_EQ(rec.ErrorExcerpt(), "ValueError: x\n  File \"<script>\", line 2, in main\n");
}

TEST(ResultRecord, Resource) {
  auto rec = ParseResultRecord(R"({"status": "resource", "kind": "memory"})", false);
  ASSERT_EQ(rec.status, RecordStatus::RESOURCE);
  EXPECT_EQ(rec.resource, ResourceKind::MEMORY);
  rec = ParseResultRecord(R"({"status": "resource", "kind": "process"})", false);
  ASSERT_EQ(rec.status, RecordStatus::RESOURCE);
  EXPECT_EQ(rec.resource, ResourceKind::PROCESS);
  rec = ParseResultRecord(R"({"status": "resource", "kind": "disk"})", false);
  EXPECT_EQ(rec.status, RecordStatus::MALFORMED);
}

TEST(ResultRecord, Absent) {
  auto rec = ParseResultRecord("", false);
  EXPECT_EQ(rec.status, RecordStatus::ABSENT);
  EXPECT_EQ(rec.ContractReason(), "script did not produce a result");
}

TEST(ResultRecord, Malformed) {
  for (const char* channel : {
      "{", "[1, 2]", "42", "not json", R"({"result": 1})", R"({"status": "ok"})",
      R"({"status": "unknown"})", R"({"status": 1})", R"({"status": "ok", "result": 1}{})"}) {
    EXPECT_EQ(ParseResultRecord(channel, false).status, RecordStatus::MALFORMED) << channel;
  }
}

TEST(ResultRecord, TruncatedIsMalformed) {
  auto rec = ParseResultRecord(R"({"status": "ok", "result": 1})", true);
  EXPECT_EQ(rec.status, RecordStatus::MALFORMED);
  EXPECT_EQ(ParseResultRecord("", true).status, RecordStatus::MALFORMED);
}

TEST(ResultRecord, DeepNestingIsMalformed) {
  const size_t depth = 1'000'000;
  std::string record = R"({"status": "ok", "result": )" + std::string(depth, '[') +
                       std::string(depth, ']') + "}";
  auto rec = ParseResultRecord(record, false);
  EXPECT_EQ(rec.status, RecordStatus::MALFORMED);

  // just inside the bound: the record object itself is one level
  const size_t inside = kMaxRecordDepth - 1;
  record = R"({"status": "ok", "result": )" + std::string(inside, '[') +
           std::string(inside, ']') + "}";
  rec = ParseResultRecord(record, false);
  ASSERT_EQ(rec.status, RecordStatus::OK);
  EXPECT_NO_THROW(rec.result.dump());
}
