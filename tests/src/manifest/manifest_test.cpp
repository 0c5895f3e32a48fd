#include <rampart/manifest/manifest.hpp>
#include <rampart/schema/error_code.hpp>
#include <rampart/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

constexpr auto kManifest = R"({
  "accounts": [
    {"name": "prod", "id": "111111111111"},
    {"name": "dev", "id": "222222222222"}
  ],
  "containers": [
    {
      "id": "web",
      "templates": [
        {
          "key": "bucket",
          "variables": ["Bucket"],
          "scope": ["s3:*"],
          "document": {
            "Version": "2012-10-17",
            "Statement": [{"Sid": "Bucket", "Effect": "Allow", "Action": "s3:*",
                           "Resource": "arn:aws:s3:::${Bucket}/*"}]
          }
        }
      ],
      "attachments": [
        {"template": "bucket", "account": "prod", "variables": {"Bucket": "logs"}}
      ]
    },
    {
      "id": "batch",
      "templates": [
        {
          "key": "worker",
          "scope": ["sqs:*"],
          "document": {"Statement": [{"Sid": "Queue", "Effect": "Allow",
                                      "Action": "sqs:SendMessage",
                                      "Resource": "*"}]},
          "service_role": {
            "name": "worker",
            "policy": {"Statement": [{"Effect": "Allow", "Action": "sqs:*", "Resource": "*"}]},
            "assume_role_policy": {"Statement": [{"Effect": "Allow",
              "Principal": {"Service": "ecs-tasks.amazonaws.com"},
              "Action": "sts:AssumeRole"}]}
          }
        }
      ],
      "attachments": [
        {"template": "bucket", "account": "dev", "variables": {"Bucket": "scratch"}},
        {"template": "worker", "account": "dev"}
      ]
    }
  ]
})";

std::string expect_error(const std::string& text, const uint32_t code) {
  auto result = rampart::manifest::load_text(text);
  EXPECT_EQ(result.code, code) << result.log;
  EXPECT_FALSE(result.loaded.has_value());
  return result.log;
}

}  // namespace

TEST(manifest, loads_accounts_templates_and_attachments) {
  auto result = rampart::manifest::load_text(kManifest);
  ASSERT_EQ(result.code, 0u) << result.log;
  ASSERT_TRUE(result.loaded.has_value());

  const auto& loaded = *result.loaded;
  EXPECT_EQ(loaded.registry->account_count(), 2u);
  EXPECT_EQ(loaded.registry->policy_template_count(), 2u);
  ASSERT_EQ(loaded.containers.size(), 2u);
  EXPECT_EQ(loaded.containers[0]->id(), "web");
  EXPECT_EQ(loaded.containers[0]->attachment_count(), 1u);
  EXPECT_EQ(loaded.containers[1]->attachment_count(), 2u);

  auto bucket = loaded.registry->find_policy_template("bucket");
  ASSERT_NE(bucket, nullptr);
  EXPECT_EQ(bucket->binding()->container_id, "web");
}

TEST(manifest, loaded_containers_compose) {
  auto result = rampart::manifest::load_text(kManifest);
  ASSERT_EQ(result.code, 0u) << result.log;

  auto batch = result.loaded->containers[1]->policy();
  ASSERT_EQ(batch.code, 0u) << batch.log;
  const auto& documents = batch.policy->account_policies.at("dev");
  ASSERT_EQ(documents.size(), 4u);
  EXPECT_EQ(documents[0].statements[0].resources,
            rampart::schema::string_list_t{"arn:aws:s3:::scratch/*"});
  EXPECT_EQ(documents[1].statements[0].sid, "Queue");
  EXPECT_EQ(documents[1].policy_version, "2012-10-17");
  EXPECT_TRUE(batch.missing.empty());
  EXPECT_EQ(documents[2].statements[0].not_actions,
            (rampart::schema::string_list_t{"s3:*", "sqs:*"}));
  EXPECT_EQ(documents[3].statements[0].sid, "AllowAll");
  EXPECT_TRUE(
      batch.policy->service_role_policies.at("dev").contains("worker"));
}

TEST(manifest, rejects_non_object_and_malformed_input) {
  EXPECT_EQ(expect_error("[]", rampart::schema::to_code(
                                   rampart::schema::error_code::invalid_manifest)),
            "manifest must be a JSON object");
  expect_error("{", rampart::schema::to_code(
                        rampart::schema::error_code::invalid_manifest));
  auto log = expect_error(
      R"({"containers": [{"templates": []}]})",
      rampart::schema::to_code(rampart::schema::error_code::invalid_manifest));
  EXPECT_EQ(log.rfind("malformed manifest: ", 0), 0u);
}

TEST(manifest, rejects_duplicate_container) {
  auto log = expect_error(
      R"({"containers": [{"id": "web"}, {"id": "web"}]})",
      rampart::schema::to_code(rampart::schema::error_code::invalid_manifest));
  EXPECT_EQ(log, "duplicate container 'web'");
}

TEST(manifest, forwards_registration_errors) {
  expect_error(
      R"({"accounts": [{"name": "prod", "id": "1"}, {"name": "prod", "id": "2"}]})",
      rampart::schema::to_code(rampart::schema::error_code::account_exists));
  expect_error(
      R"({"containers": [{"id": "web", "templates": [{"key": "t"}, {"key": "t"}]}]})",
      rampart::schema::to_code(
          rampart::schema::error_code::policy_template_exists));
  auto log = expect_error(
      R"({"accounts": [{"name": "prod", "id": "1"}],
          "containers": [{"id": "web",
            "templates": [{"key": "t", "variables": ["Bucket"]}],
            "attachments": [{"template": "t", "account": "prod"}]}]})",
      rampart::schema::to_code(rampart::schema::error_code::variable_missing));
  EXPECT_NE(log.find("'Bucket'"), std::string::npos);
}

TEST(manifest, loads_from_file) {
  auto path = rampart::testing::make_temp_path("rampart_manifest");
  rampart::testing::write_file(path, kManifest);
  auto result = rampart::manifest::load_file(path);
  rampart::testing::remove_path(path);
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(result.loaded->containers.size(), 2u);

  auto missing = rampart::manifest::load_file(path);
  EXPECT_EQ(missing.code, rampart::schema::to_code(
                              rampart::schema::error_code::invalid_manifest));
  EXPECT_EQ(missing.log, "cannot open manifest '" + path + "'");
}
