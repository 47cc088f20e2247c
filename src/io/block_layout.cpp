// =============================================================================
// blkstore - Block Layout Implementation
// =============================================================================

#include "blkstore/io/block_layout.h"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <utility>

#include "blkstore/codec/checksum.h"
#include "blkstore/common/types.h"

namespace blkstore::io {

namespace {

/// @brief Quantity suffixes and their multipliers.
constexpr std::array<std::pair<std::string_view, std::uint64_t>, 11> kQuantitySuffixes = {{
    {"", 1ULL},
    {"Ki", 1ULL << 10},
    {"Mi", 1ULL << 20},
    {"Gi", 1ULL << 30},
    {"Ti", 1ULL << 40},
    {"Pi", 1ULL << 50},
    {"k", 1'000ULL},
    {"M", 1'000'000ULL},
    {"G", 1'000'000'000ULL},
    {"T", 1'000'000'000'000ULL},
    {"P", 1'000'000'000'000'000ULL},
}};

bool isDigit(char c) noexcept {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool isHex(std::string_view text) noexcept {
    return std::ranges::all_of(text,
                               [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

Result<std::uint64_t> invalidQuantity(std::string_view text, std::string_view reason) {
    return makeError<std::uint64_t>(ErrorCode::kInvalidArgument,
                                    fmt::format("invalid quantity '{}': {}", text, reason));
}

}  // namespace

// =============================================================================
// Paths
// =============================================================================

std::string volumePath(std::string_view volumeName) {
    const std::string hash = codec::hashName(volumeName);
    return fmt::format("{}/{}/{}/{}/{}", kBackupstoreBase, kVolumeDirectory, hash.substr(0, 2),
                       hash.substr(2, 2), volumeName);
}

std::string blockDirectory(std::string_view volumeName) {
    return fmt::format("{}/{}/", volumePath(volumeName), kBlocksDirectory);
}

Result<std::string> blockFilePath(std::string_view volumeName, std::string_view checksum) {
    if (volumeName.empty() || volumeName.find('/') != std::string_view::npos ||
        volumeName == "." || volumeName == "..") {
        return makeError<std::string>(ErrorCode::kInvalidArgument,
                                      fmt::format("invalid volume name '{}'", volumeName));
    }
    if (checksum.size() < kBlockSeparateLayer2 || !isHex(checksum)) {
        return makeError<std::string>(ErrorCode::kInvalidArgument,
                                      fmt::format("invalid block checksum '{}'", checksum));
    }

    const std::string_view layer1 = checksum.substr(0, kBlockSeparateLayer1);
    const std::string_view layer2 =
        checksum.substr(kBlockSeparateLayer1, kBlockSeparateLayer2 - kBlockSeparateLayer1);
    return fmt::format("{}{}/{}/{}{}", blockDirectory(volumeName), layer1, layer2, checksum,
                       kBlockSuffix);
}

// =============================================================================
// Block Size
// =============================================================================

Result<std::uint64_t> parseQuantity(std::string_view text) {
    if (text.empty()) {
        return invalidQuantity(text, "empty");
    }

    std::size_t pos = 0;
    while (pos < text.size() && isDigit(text[pos])) {
        ++pos;
    }
    const std::string_view integerPart = text.substr(0, pos);

    std::string_view fractionPart;
    if (pos < text.size() && text[pos] == '.') {
        const std::size_t fractionStart = ++pos;
        while (pos < text.size() && isDigit(text[pos])) {
            ++pos;
        }
        fractionPart = text.substr(fractionStart, pos - fractionStart);
        if (fractionPart.empty()) {
            return invalidQuantity(text, "missing digits after '.'");
        }
    }
    if (integerPart.empty() && fractionPart.empty()) {
        return invalidQuantity(text, "expected a non-negative number");
    }

    const std::string_view suffix = text.substr(pos);
    const auto suffixIt = std::ranges::find_if(
        kQuantitySuffixes, [suffix](const auto& entry) { return entry.first == suffix; });
    if (suffixIt == kQuantitySuffixes.end()) {
        return invalidQuantity(text, fmt::format("unknown suffix '{}'", suffix));
    }
    const std::uint64_t multiplier = suffixIt->second;

    std::uint64_t whole = 0;
    if (!integerPart.empty()) {
        const auto [ptr, ec] =
            std::from_chars(integerPart.data(), integerPart.data() + integerPart.size(), whole);
        if (ec != std::errc{} || ptr != integerPart.data() + integerPart.size()) {
            return invalidQuantity(text, "number out of range");
        }
    }
    if (whole > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        return invalidQuantity(text, "number out of range");
    }
    std::uint64_t value = whole * multiplier;

    if (!fractionPart.empty()) {
        long double fraction = 0.0L;
        long double scale = 1.0L;
        for (char c : fractionPart) {
            scale /= 10.0L;
            fraction += static_cast<long double>(c - '0') * scale;
        }
        const auto extra =
            static_cast<std::uint64_t>(std::ceil(fraction * static_cast<long double>(multiplier)));
        if (extra > std::numeric_limits<std::uint64_t>::max() - value) {
            return invalidQuantity(text, "number out of range");
        }
        value += extra;
    }
    return value;
}

Result<std::uint64_t> blockSizeFromParameters(
    const std::map<std::string, std::string, std::less<>>& parameters) {
    const auto it = parameters.find(kBlockSizeParameter);
    if (it == parameters.end() || it->second.empty()) {
        return kDefaultBlockSize;
    }

    auto size = parseQuantity(it->second);
    if (!size) {
        return std::unexpected(size.error().wrap(
            fmt::format("invalid block size {} from parameter {}", it->second, kBlockSizeParameter)));
    }
    if (*size == 0) {
        return kDefaultBlockSize;
    }
    if (*size > kMaxBlockSize) {
        return makeError<std::uint64_t>(
            ErrorCode::kInvalidArgument,
            fmt::format("block size {} from parameter {} exceeds the maximum of {} bytes",
                        it->second, kBlockSizeParameter, kMaxBlockSize));
    }
    return *size;
}

}  // namespace blkstore::io
