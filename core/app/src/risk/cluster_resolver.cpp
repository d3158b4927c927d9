#include "tradegate/risk/cluster_resolver.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

namespace tradegate {

namespace {

struct Bucket {
  const char* cluster;
  std::vector<const char*> symbols;
};

bool listed(const Bucket& bucket, const std::string& symbol) {
  return std::any_of(bucket.symbols.begin(), bucket.symbols.end(),
                     [&](const char* s) { return symbol == s; });
}

const std::array<Bucket, 3>& cryptoBuckets() {
  static const std::array<Bucket, 3> kBuckets = {{
      {"CRYPTO_BETA",
       {"BTC", "ETH", "SOL", "AVAX", "RNDR", "FET", "TAO", "NEAR", "APT",
        "ARB", "OP", "SUI"}},
      {"CRYPTO_AI_NARRATIVE", {"FET", "RNDR", "TAO", "AGIX", "OCEAN", "GRT"}},
      {"CRYPTO_L1", {"ADA", "DOT", "ATOM", "AVAX", "SOL", "NEAR"}},
  }};
  return kBuckets;
}

const std::array<Bucket, 4>& equityBuckets() {
  static const std::array<Bucket, 4> kBuckets = {{
      {"AI_TECH",
       {"NVDA", "AAPL", "AMD", "MSFT", "META", "GOOGL", "QQQ", "SOXL", "TSLA"}},
      {"RISK_ON_GROWTH", {"IWM", "ARKK", "SHOP", "SNOW", "NET", "PLTR"}},
      {"ENERGY", {"XOM", "CVX", "COP", "XLE"}},
      {"FINANCIALS", {"JPM", "BAC", "GS", "MS", "XLF"}},
  }};
  return kBuckets;
}

template <typename Buckets>
const char* firstMatch(const Buckets& buckets, const std::string& symbol,
                       const char* fallback) {
  for (const auto& b : buckets) {
    if (listed(b, symbol)) {
      return b.cluster;
    }
  }
  return fallback;
}

}  // namespace

std::string StaticClusterResolver::resolve(domain::Market market,
                                           std::string_view symbol) const {
  std::string s(symbol);
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });

  switch (market) {
    case domain::Market::Crypto:
      return firstMatch(cryptoBuckets(), s, "CRYPTO_CORE");
    case domain::Market::Equities:
      return firstMatch(equityBuckets(), s, "GENERAL");
  }
  return "GENERAL";
}

const StaticClusterResolver& StaticClusterResolver::instance() {
  static const StaticClusterResolver kInstance;
  return kInstance;
}

}  // namespace tradegate
