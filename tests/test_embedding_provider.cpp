#include "sqlrag/embedding/embedding_config.h"
#include "sqlrag/embedding/embedding_provider.h"
#include "sqlrag/embedding/http_embedding_provider.h"

#include "support/fakes.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace sqlrag;
using embedding::DeterministicStubEmbeddingProvider;

TEST_CASE("Stub embeddings are unit vectors of the configured dimension", "[embedding]") {
  DeterministicStubEmbeddingProvider provider(64);
  REQUIRE(provider.dimension() == 64);

  for (const char* text : {"查询所有用户信息", "list all products", "", "!!!"}) {
    const auto v = provider.embed_text(text);
    REQUIRE(v.size() == 64);
    CHECK_THAT(vector::l2_norm(v), Catch::Matchers::WithinAbs(1.0, 1e-5));
  }
}

TEST_CASE("Stub embeddings are deterministic", "[embedding]") {
  DeterministicStubEmbeddingProvider a(128);
  DeterministicStubEmbeddingProvider b(128);
  CHECK(a.embed_text("统计每个分类的商品数量") == b.embed_text("统计每个分类的商品数量"));
}

TEST_CASE("Stub embeddings rank shared tokens above unrelated text", "[embedding]") {
  DeterministicStubEmbeddingProvider provider(128);
  const auto query = provider.embed_text("查询价格大于100的商品");
  const auto related = provider.embed_text("查询价格大于100的商品名称和价格");
  const auto unrelated = provider.embed_text("monthly revenue trend");

  CHECK(vector::inner_product(query, related) > vector::inner_product(query, unrelated));
}

TEST_CASE("embed_batch matches embed_text element-wise", "[embedding]") {
  DeterministicStubEmbeddingProvider provider(32);
  const std::vector<std::string> texts = {"users", "orders by month", "查询订单"};
  const auto batch = provider.embed_batch(texts);
  REQUIRE(batch.size() == texts.size());
  for (std::size_t i = 0; i < texts.size(); ++i) {
    CHECK(batch[i] == provider.embed_text(texts[i]));
  }
}

TEST_CASE("Stub provider rejects a zero dimension", "[embedding]") {
  CHECK_THROWS_AS(DeterministicStubEmbeddingProvider(0), std::invalid_argument);
}

TEST_CASE("parse_embedding_provider_kind vocabulary", "[embedding][config]") {
  CHECK(embedding::parse_embedding_provider_kind("stub") ==
        std::optional{embedding::EmbeddingProviderKind::kStub});
  CHECK(embedding::parse_embedding_provider_kind("http") ==
        std::optional{embedding::EmbeddingProviderKind::kHttp});
  CHECK_FALSE(embedding::parse_embedding_provider_kind("openai").has_value());
}

TEST_CASE("validate_embedding_config", "[embedding][config]") {
  embedding::EmbeddingConfig config;
  CHECK(embedding::validate_embedding_config(config).empty());

  config.dimension = 0;
  CHECK_FALSE(embedding::validate_embedding_config(config).empty());

  config.dimension = 8;
  config.kind = embedding::EmbeddingProviderKind::kHttp;
  config.base_url.clear();
  CHECK_FALSE(embedding::validate_embedding_config(config).empty());
}

TEST_CASE("make_embedding_provider selects by kind", "[embedding][config]") {
  testing::FakeHttpClient http;
  embedding::EmbeddingConfig config;
  config.dimension = 16;

  auto stub = embedding::make_embedding_provider(config, http);
  CHECK(stub->provider_id() == "deterministic-stub");
  CHECK(stub->dimension() == 16);

  config.kind = embedding::EmbeddingProviderKind::kHttp;
  config.model = "bge-small";
  auto remote = embedding::make_embedding_provider(config, http);
  CHECK(remote->provider_id() == "http:bge-small");
  CHECK(http.requests().empty());
}
