#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "checkpoint/checkpoint.hpp"
#include "client/settings.hpp"

namespace swr
{
enum class CheckpointError : uint8_t
{
  NotFound,
  IoFailed,
  BadMagic,
  UnsupportedVersion,
  WrongEncoding,
  Truncated,
  Malformed,
  Inconsistent,
  CompressionFailed,
};

std::string_view to_string(CheckpointError error);

std::string_view to_string(CheckpointFormat format);

std::optional<CheckpointFormat> parse_checkpoint_format(std::string_view name);

std::vector<uint8_t> encode_checkpoint(const Checkpoint& checkpoint,
                                       CheckpointFormat format);

/// Decodes data written in the given format. Fails with WrongEncoding when
/// the data declares the other format.
std::expected<Checkpoint, CheckpointError> decode_checkpoint(
    std::span<const uint8_t> data, CheckpointFormat format);

/// Detects the encoding from the leading bytes.
std::optional<CheckpointFormat> sniff_checkpoint_format(std::span<const uint8_t> data);

/// Decodes a checkpoint of either format, compressed or not.
std::expected<Checkpoint, CheckpointError> decode_any_checkpoint(
    std::span<const uint8_t> data);

/// Compressed checkpoints: "SWRZ", big-endian inflated length, zlib stream.
/// decode_checkpoint inflates them transparently.
bool is_compressed_checkpoint(std::span<const uint8_t> data);

std::expected<std::vector<uint8_t>, CheckpointError> compress_checkpoint(
    std::span<const uint8_t> data);

std::expected<std::vector<uint8_t>, CheckpointError> decompress_checkpoint(
    std::span<const uint8_t> data);
}  // namespace swr
