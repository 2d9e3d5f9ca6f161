#include "crec/vector/exact_cosine_index.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace crec::vector;
using crec::core::ItemId;

namespace {

EmbeddingStore build_store(MappingSource source) {
  auto store = EmbeddingStore::build(std::move(source), {});
  REQUIRE(store.has_value());
  return std::move(store.value());
}

}  // namespace

TEST_CASE("ExactCosineIndex ranks neighbours by cosine similarity", "[vector][index]") {
  const auto store = build_store(MappingSource{{{ItemId{1}, {1.0f, 0.0f}},
                                                {ItemId{2}, {1.0f, 0.0f}},
                                                {ItemId{3}, {0.0f, 1.0f}}}});
  const ExactCosineIndex index(store);

  const auto neighbors = index.neighbors_of(ItemId{1}, 2);
  REQUIRE(neighbors.size() == 2);
  CHECK(neighbors[0].item_id == ItemId{2});
  CHECK_THAT(neighbors[0].score, Catch::Matchers::WithinAbs(1.0, 1e-9));
  CHECK(neighbors[1].item_id == ItemId{3});
  CHECK_THAT(neighbors[1].score, Catch::Matchers::WithinAbs(0.0, 1e-9));
}

TEST_CASE("ExactCosineIndex never returns the query item and respects k", "[vector][index]") {
  const auto store = build_store(MappingSource{{{ItemId{1}, {1.0f, 2.0f}},
                                                {ItemId{2}, {1.0f, 2.0f}},
                                                {ItemId{3}, {-1.0f, 0.5f}},
                                                {ItemId{4}, {0.3f, -2.0f}},
                                                {ItemId{5}, {-4.0f, -4.0f}}}});
  const ExactCosineIndex index(store);

  for (const auto& id : store.ids()) {
    for (std::size_t k : {0U, 1U, 3U, 10U}) {
      const auto neighbors = index.neighbors_of(id, k);
      CHECK(neighbors.size() <= k);
      CHECK(neighbors.size() <= store.size() - 1);
      for (std::size_t i = 0; i < neighbors.size(); ++i) {
        CHECK(neighbors[i].item_id != id);
        CHECK(neighbors[i].score >= -1.0);
        CHECK(neighbors[i].score <= 1.0);
        if (i > 0) {
          CHECK(neighbors[i - 1].score >= neighbors[i].score);
        }
      }
    }
  }
}

TEST_CASE("ExactCosineIndex excludes the query even when a duplicate vector exists",
          "[vector][index]") {
  const auto store = build_store(
      MappingSource{{{ItemId{1}, {0.6f, 0.8f}}, {ItemId{2}, {0.6f, 0.8f}}}});
  const ExactCosineIndex index(store);

  const auto neighbors = index.neighbors_of(ItemId{2}, 5);
  REQUIRE(neighbors.size() == 1);
  CHECK(neighbors[0].item_id == ItemId{1});
  CHECK(neighbors[0].score <= 1.0);
}

TEST_CASE("ExactCosineIndex breaks exact ties by store order", "[vector][index]") {
  const auto store = build_store(MappingSource{{{ItemId{9}, {1.0f, 0.0f}},
                                                {ItemId{30}, {0.0f, 1.0f}},
                                                {ItemId{10}, {0.0f, 1.0f}},
                                                {ItemId{20}, {0.0f, 1.0f}}}});
  const ExactCosineIndex index(store);

  const auto neighbors = index.neighbors_of(ItemId{9}, 3);
  REQUIRE(neighbors.size() == 3);
  CHECK(neighbors[0].item_id == ItemId{30});
  CHECK(neighbors[1].item_id == ItemId{10});
  CHECK(neighbors[2].item_id == ItemId{20});
}

TEST_CASE("ExactCosineIndex scores zero vectors as 0", "[vector][index]") {
  const auto store = build_store(MappingSource{
      {{ItemId{1}, {0.0f, 0.0f}}, {ItemId{2}, {1.0f, 0.0f}}, {ItemId{3}, {-1.0f, 0.0f}}}});
  const ExactCosineIndex index(store);

  for (const auto& n : index.neighbors_of(ItemId{1}, 2)) {
    CHECK(n.score == 0.0);
  }
  const auto from_two = index.neighbors_of(ItemId{2}, 2);
  REQUIRE(from_two.size() == 2);
  CHECK(from_two[0].item_id == ItemId{1});
  CHECK(from_two[0].score == 0.0);
  CHECK_THAT(from_two[1].score, Catch::Matchers::WithinAbs(-1.0, 1e-9));
}

TEST_CASE("ExactCosineIndex returns nothing for an unknown item", "[vector][index]") {
  const auto store = build_store(MappingSource{{{ItemId{1}, {1.0f}}, {ItemId{2}, {1.0f}}}});
  const ExactCosineIndex index(store);
  CHECK(index.neighbors_of(ItemId{404}, 5).empty());
}

TEST_CASE("ExactCosineIndex::cosine_similarity", "[vector][index]") {
  CHECK_THAT(ExactCosineIndex::cosine_similarity({1.0f, 0.0f}, {2.0f, 0.0f}),
             Catch::Matchers::WithinAbs(1.0, 1e-9));
  CHECK_THAT(ExactCosineIndex::cosine_similarity({1.0f, 0.0f}, {0.0f, 3.0f}),
             Catch::Matchers::WithinAbs(0.0, 1e-9));
  CHECK(ExactCosineIndex::cosine_similarity({0.0f, 0.0f}, {1.0f, 1.0f}) == 0.0);
  CHECK(ExactCosineIndex::cosine_similarity({1.0f}, {1.0f, 1.0f}) == 0.0);
}
