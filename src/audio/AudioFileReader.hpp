// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <vad/DetectorConfig.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace vadkit
{

/// @brief Callback invoked with consecutive chunks of decoded audio.
/// @param samples Float32 mono PCM at the requested sample rate.
using ChunkCallback = std::function<void(std::span<const float> samples)>;

/// @brief Reads an audio file through miniaudio's decoder.
///
/// Any format miniaudio decodes (WAV, FLAC, MP3) is converted to float32 mono at the
/// sample rate of the StreamFormat passed to open().
class AudioFileReader
{
  public:
    AudioFileReader();
    ~AudioFileReader();

    AudioFileReader(const AudioFileReader&) = delete;
    AudioFileReader& operator=(const AudioFileReader&) = delete;

    /// @brief Opens a file for decoding.
    /// @param path Path to the audio file.
    /// @param format Target sample rate (the block size is not used here).
    /// @return Success or ErrorCode::IoError.
    [[nodiscard]] auto open(std::string_view path, const StreamFormat& format) -> VoidResult;

    /// @brief Decodes the remainder of the file.
    /// @param callback Receives chunks of at most chunkFrames samples, in order.
    /// @param chunkFrames Maximum chunk size in frames.
    /// @return Number of frames delivered, or an error.
    [[nodiscard]] auto read(const ChunkCallback& callback, std::uint32_t chunkFrames = 1024)
        -> Result<std::uint64_t>;

    /// @brief Length of the file in output frames, if the decoder knows it.
    [[nodiscard]] auto totalFrames() const -> std::optional<std::uint64_t>;

    [[nodiscard]] auto isOpen() const -> bool;

    /// @brief Closes the file. Called by the destructor.
    void close();

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace vadkit
