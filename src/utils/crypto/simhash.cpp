#include "simhash.hpp"
#include <bitset>
#include <cctype>
#include <unordered_set>

namespace Burrow {
namespace Utils {
namespace Crypto {

namespace {

constexpr uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME        = 0x100000001b3ULL;
constexpr int      FINGERPRINT_BITS = 64;

const std::unordered_set<std::string>& stop_words() {
    static const std::unordered_set<std::string> words = {
        "a",    "about", "above", "after", "again", "all",   "am",    "an",   "and",  "any",
        "are",  "as",    "at",    "be",    "been",  "being", "but",   "by",   "can",  "did",
        "do",   "does",  "for",   "from",  "had",   "has",   "have",  "he",   "her",  "here",
        "him",  "his",   "how",   "i",     "if",    "in",    "into",  "is",   "it",   "its",
        "me",   "more",  "my",    "no",    "not",   "of",    "on",    "or",   "our",  "out",
        "she",  "so",    "some",  "than",  "that",  "the",   "their", "them", "then", "there",
        "they", "this",  "to",    "too",   "up",    "us",    "was",   "we",   "were", "what",
        "when", "which", "who",   "will",  "with",  "you",   "your"};
    return words;
}

}  // namespace

uint64_t SimHash::fnv1a(const std::string& token) {
    uint64_t hash = FNV_OFFSET_BASIS;
    for (unsigned char c : token) {
        hash ^= c;
        hash *= FNV_PRIME;
    }
    return hash;
}

std::vector<std::string> SimHash::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string              current;

    auto flush = [&]() {
        if (!current.empty() && !stop_words().count(current))
            tokens.push_back(current);
        current.clear();
    };

    for (unsigned char c : text) {
        if (std::isalnum(c))
            current += static_cast<char>(std::tolower(c));
        else if (std::isspace(c))
            flush();
        // Punctuation is dropped without splitting, so "don't" becomes "dont".
    }
    flush();
    return tokens;
}

uint64_t SimHash::fingerprint(const std::string& text) {
    int weights[FINGERPRINT_BITS] = {0};

    for (const auto& token : tokenize(text)) {
        uint64_t hash = fnv1a(token);
        for (int bit = 0; bit < FINGERPRINT_BITS; ++bit)
            weights[bit] += ((hash >> bit) & 1ULL) ? 1 : -1;
    }

    uint64_t result = 0;
    for (int bit = 0; bit < FINGERPRINT_BITS; ++bit) {
        if (weights[bit] > 0)
            result |= (1ULL << bit);
    }
    return result;
}

int SimHash::distance(uint64_t a, uint64_t b) {
    return static_cast<int>(std::bitset<FINGERPRINT_BITS>(a ^ b).count());
}

double SimHash::similarity(uint64_t a, uint64_t b) {
    return 1.0 - static_cast<double>(distance(a, b)) / FINGERPRINT_BITS;
}

}  // namespace Crypto
}  // namespace Utils
}  // namespace Burrow
