#include "codescope/embeddings.hpp"

#include "codescope/errors.hpp"
#include "codescope/tokenizer.hpp"

#include <cmath>
#include <cstdint>
#include <string_view>

namespace codescope {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;
constexpr float kStemWeight = 0.5F;

std::uint64_t HashToken(std::string_view token) {
  std::uint64_t hash = kFnvOffset;
  for (const unsigned char ch : token) {
    hash ^= static_cast<std::uint64_t>(ch);
    hash *= kFnvPrime;
  }
  return hash;
}

void NormalizeL2(std::vector<float>& v) {
  double sum_sq = 0.0;
  for (const auto x : v) {
    sum_sq += static_cast<double>(x) * static_cast<double>(x);
  }
  if (sum_sq <= 0.0) {
    return;
  }
  const auto inv_norm = 1.0 / std::sqrt(sum_sq);
  for (auto& x : v) {
    x = static_cast<float>(static_cast<double>(x) * inv_norm);
  }
}

}  // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(int dimensions, std::size_t memoization_capacity)
    : dimensions_(dimensions), memoization_capacity_(memoization_capacity) {
  if (dimensions_ <= 0) {
    throw ConfigurationError("HashingEmbeddingProvider dimensions must be positive");
  }
}

int HashingEmbeddingProvider::dimensions() const {
  return dimensions_;
}

bool HashingEmbeddingProvider::normalize() const {
  return true;
}

std::optional<EmbeddingIdentity> HashingEmbeddingProvider::identity() const {
  return EmbeddingIdentity{
      .provider = std::string("CodeScope"),
      .model = std::string("feature-hashing"),
      .dimensions = dimensions_,
      .normalized = true,
  };
}

std::vector<float> HashingEmbeddingProvider::Compute(const std::string& text) const {
  const auto dims = static_cast<std::uint64_t>(dimensions_);
  std::vector<float> embedding(static_cast<std::size_t>(dimensions_), 0.0F);

  auto add = [&](std::string_view token, float weight) {
    const auto hash = HashToken(token);
    const auto index = static_cast<std::size_t>(hash % dims);
    const float sign = ((hash >> 63U) != 0U) ? -1.0F : 1.0F;
    embedding[index] += sign * weight;
  };
  for (const auto& token : Tokenize(text)) {
    add(token, 1.0F);
    const auto stem = Stem(token);
    if (stem != token) {
      add(stem, kStemWeight);
    }
  }

  if (normalize()) {
    NormalizeL2(embedding);
  }
  return embedding;
}

std::vector<float> HashingEmbeddingProvider::Embed(const std::string& text) {
  if (memoization_capacity_ > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cached = memoized_embeddings_.find(text);
    if (cached != memoized_embeddings_.end()) {
      return cached->second;
    }
  }

  auto embedding = Compute(text);

  if (memoization_capacity_ > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (memoized_embeddings_.find(text) == memoized_embeddings_.end()) {
      while (memoized_embeddings_.size() >= memoization_capacity_ && !memoization_order_.empty()) {
        memoized_embeddings_.erase(memoization_order_.front());
        memoization_order_.pop_front();
      }
      memoization_order_.push_back(text);
      memoized_embeddings_[text] = embedding;
    }
  }
  return embedding;
}

std::vector<std::vector<float>> HashingEmbeddingProvider::EmbedBatch(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> out{};
  out.reserve(texts.size());
  for (const auto& text : texts) {
    out.push_back(Embed(text));
  }
  return out;
}

std::size_t HashingEmbeddingProvider::cache_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return memoized_embeddings_.size();
}

}  // namespace codescope
