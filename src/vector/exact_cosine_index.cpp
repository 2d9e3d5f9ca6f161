#include "crec/vector/exact_cosine_index.h"

#include <algorithm>
#include <cmath>

namespace crec::vector {

namespace {

double dot(const float* a, const float* b, std::size_t dim) {
  double sum = 0.0;
  for (std::size_t i = 0; i < dim; ++i) {
    sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return sum;
}

struct ScoredRow {
  std::size_t row;
  double score;
};

}  // namespace

ExactCosineIndex::ExactCosineIndex(const EmbeddingStore& store) : store_(store) {
  norms_.reserve(store_.size());
  for (std::size_t row = 0; row < store_.size(); ++row) {
    const float* v = store_.row_data(row);
    norms_.push_back(std::sqrt(dot(v, v, store_.dim())));
  }
}

std::vector<Neighbor> ExactCosineIndex::neighbors_of(const core::ItemId& item_id,
                                                     std::size_t k) const {
  std::vector<Neighbor> neighbors;
  auto query_row = store_.row_of(item_id);
  if (!query_row.has_value() || k == 0) {
    return neighbors;
  }

  const std::size_t dim = store_.dim();
  const float* query = store_.row_data(query_row.value());
  const double query_norm = norms_[query_row.value()];

  std::vector<ScoredRow> scored;
  scored.reserve(store_.size());
  for (std::size_t row = 0; row < store_.size(); ++row) {
    // The query is excluded by identity, not by rank: a duplicate vector also scores 1.0.
    if (row == query_row.value()) {
      continue;
    }
    double score = 0.0;
    if (query_norm != 0.0 && norms_[row] != 0.0) {
      score = dot(query, store_.row_data(row), dim) / (query_norm * norms_[row]);
      // Floating point can push parallel vectors a hair past the bound.
      score = std::clamp(score, -1.0, 1.0);
    }
    scored.push_back(ScoredRow{row, score});
  }

  const std::size_t take = std::min(k, scored.size());
  std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(take),
                    scored.end(), [](const ScoredRow& a, const ScoredRow& b) {
                      if (a.score != b.score) {
                        return a.score > b.score;  // Higher score first
                      }
                      return a.row < b.row;  // Store order among exact ties
                    });

  neighbors.reserve(take);
  for (std::size_t i = 0; i < take; ++i) {
    neighbors.push_back(Neighbor{store_.id_at(scored[i].row), scored[i].score});
  }
  return neighbors;
}

double ExactCosineIndex::cosine_similarity(const Vector& a, const Vector& b) {
  if (a.size() != b.size() || a.empty()) {
    return 0.0;
  }

  const double norm_a = std::sqrt(dot(a.data(), a.data(), a.size()));
  const double norm_b = std::sqrt(dot(b.data(), b.data(), b.size()));

  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0;
  }

  return std::clamp(dot(a.data(), b.data(), a.size()) / (norm_a * norm_b), -1.0, 1.0);
}

}  // namespace crec::vector
