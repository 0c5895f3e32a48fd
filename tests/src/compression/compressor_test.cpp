#include <rampart/compression/compressor.hpp>
#include <rampart/schema/error_code.hpp>
#include <rampart/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

using rampart::testing::make_document;

rampart::schema::policy_document_t unversioned(
    const std::string& sid,
    const std::string& action) {
  auto document = make_document(sid, action);
  document.policy_version.clear();
  return document;
}

}  // namespace

TEST(compressor, encoded_size_counts_minified_json) {
  auto document = rampart::schema::policy_document_t{};
  EXPECT_EQ(rampart::compression::encoded_size(document),
            std::string{R"({"Statement":[]})"}.size());
}

TEST(compressor, stamps_version_and_keeps_placeholders_empty) {
  auto policy = rampart::schema::policy_t{};
  policy.account_policies["A"] = {rampart::schema::policy_document_t{},
                                  unversioned("Read", "s3:GetObject")};

  auto result = rampart::compression::compress(
      policy, rampart::compression::limits{});
  ASSERT_EQ(result.code, 0u) << result.log;
  const auto& documents = policy.account_policies.at("A");
  ASSERT_EQ(documents.size(), 2u);
  EXPECT_TRUE(documents[0].policy_version.empty());
  EXPECT_EQ(documents[1].policy_version, "2012-10-17");
}

TEST(compressor, leaves_documents_alone_within_count) {
  auto policy = rampart::schema::policy_t{};
  auto documents = rampart::schema::policy_documents_t{};
  for (auto i = 0; i < 10; ++i) {
    documents.push_back(make_document("S" + std::to_string(i), "s3:*"));
  }
  policy.account_policies["A"] = documents;

  auto result = rampart::compression::compress(
      policy, rampart::compression::limits{});
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(policy.account_policies.at("A"), documents);
}

TEST(compressor, packs_statements_in_order_when_over_count) {
  auto policy = rampart::schema::policy_t{};
  auto& documents = policy.account_policies["A"];
  for (auto i = 0; i < 12; ++i) {
    documents.push_back(make_document("S" + std::to_string(i), "s3:*"));
  }
  documents.insert(documents.begin() + 3, rampart::schema::policy_document_t{});

  auto result = rampart::compression::compress(
      policy, rampart::compression::limits{});
  ASSERT_EQ(result.code, 0u) << result.log;
  const auto& packed = policy.account_policies.at("A");
  ASSERT_EQ(packed.size(), 1u);
  EXPECT_EQ(packed[0].policy_version, "2012-10-17");
  ASSERT_EQ(packed[0].statements.size(), 12u);
  for (auto i = 0; i < 12; ++i) {
    EXPECT_EQ(packed[0].statements[static_cast<std::size_t>(i)].sid,
              "S" + std::to_string(i));
  }
}

TEST(compressor, splits_documents_on_duplicate_sid) {
  auto policy = rampart::schema::policy_t{};
  auto& documents = policy.account_policies["A"];
  for (auto i = 0; i < 4; ++i) {
    documents.push_back(make_document("Same", "s3:*"));
  }
  auto limits = rampart::compression::limits{};
  limits.max_documents_per_account = 3;

  auto result = rampart::compression::compress(policy, limits);
  EXPECT_EQ(result.code,
            rampart::schema::to_code(
                rampart::schema::error_code::too_many_policy_documents));
  EXPECT_EQ(result.codespace, "rampart.compress");
  EXPECT_EQ(policy.account_policies.at("A").size(), 4u);
}

TEST(compressor, packing_respects_document_size) {
  auto policy = rampart::schema::policy_t{};
  auto& documents = policy.account_policies["A"];
  for (auto i = 0; i < 4; ++i) {
    documents.push_back(make_document("S" + std::to_string(i), "s3:*"));
  }
  auto pair = documents[0];
  pair.statements.push_back(documents[1].statements.front());
  auto limits = rampart::compression::limits{};
  limits.max_documents_per_account = 3;
  limits.max_document_size = rampart::compression::encoded_size(pair);

  auto result = rampart::compression::compress(policy, limits);
  ASSERT_EQ(result.code, 0u) << result.log;
  const auto& packed = policy.account_policies.at("A");
  ASSERT_EQ(packed.size(), 2u);
  EXPECT_EQ(packed[0].statements.size(), 2u);
  EXPECT_EQ(packed[1].statements.size(), 2u);
  for (const auto& document : packed) {
    EXPECT_LE(rampart::compression::encoded_size(document),
              limits.max_document_size);
  }
}

TEST(compressor, rejects_oversized_document) {
  auto policy = rampart::schema::policy_t{};
  policy.account_policies["A"] = {make_document("Read", "s3:GetObject")};
  auto limits = rampart::compression::limits{};
  limits.max_document_size = 20;

  auto result = rampart::compression::compress(policy, limits);
  EXPECT_EQ(result.code,
            rampart::schema::to_code(
                rampart::schema::error_code::policy_document_too_large));
  EXPECT_NE(result.log.find("account 'A'"), std::string::npos);
}

TEST(compressor, rejects_oversized_service_role_policies) {
  auto policy = rampart::schema::policy_t{};
  policy.service_role_policies["A"]["worker"] =
      rampart::schema::service_role_policy_t{
          .policy = make_document("Logs", "logs:*"),
          .assume_role_policy = unversioned("Trust", "sts:AssumeRole")};

  auto limits = rampart::compression::limits{};
  limits.max_assume_role_policy_size = 30;
  auto result = rampart::compression::compress(policy, limits);
  EXPECT_EQ(result.code,
            rampart::schema::to_code(
                rampart::schema::error_code::service_role_policy_too_large));
  EXPECT_NE(result.log.find("service role 'worker'"), std::string::npos);
  EXPECT_EQ(policy.service_role_policies.at("A")
                .at("worker")
                .assume_role_policy.policy_version,
            "2012-10-17");
}

TEST(compressor, packs_role_list_whenever_account_list_is_packed) {
  auto policy = rampart::schema::policy_t{};
  auto& account = policy.account_policies["A"];
  for (auto i = 0; i < 11; ++i) {
    account.push_back(make_document("S" + std::to_string(i), "s3:*"));
  }
  policy.account_role_policies["A"] = rampart::schema::policy_documents_t(
      account.begin(), account.begin() + 10);

  auto result = rampart::compression::compress(
      policy, rampart::compression::limits{});
  ASSERT_EQ(result.code, 0u) << result.log;
  const auto& packed_account = policy.account_policies.at("A");
  const auto& packed_role = policy.account_role_policies.at("A");
  ASSERT_EQ(packed_account.size(), 1u);
  ASSERT_EQ(packed_role.size(), 1u);
  ASSERT_EQ(packed_role[0].statements.size(), 10u);
  for (std::size_t i = 0; i < packed_role[0].statements.size(); ++i) {
    EXPECT_EQ(packed_role[0].statements[i], packed_account[0].statements[i]);
  }
}

TEST(compressor, reports_invalid_utf8_as_error) {
  auto policy = rampart::schema::policy_t{};
  policy.account_policies["A"] = {make_document("Read", "s3:\xff")};

  auto result = rampart::compression::compress(
      policy, rampart::compression::limits{});
  EXPECT_EQ(result.code,
            rampart::schema::to_code(
                rampart::schema::error_code::policy_document_unencodable));
  EXPECT_EQ(result.codespace, "rampart.compress");
  EXPECT_NE(result.log.find("cannot be encoded"), std::string::npos);
}
