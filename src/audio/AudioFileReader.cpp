// SPDX-License-Identifier: Apache-2.0
#include "AudioFileReader.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <string>
#include <vector>

namespace vadkit
{

struct AudioFileReader::Impl
{
    ma_decoder decoder {};
    bool initialized = false;
    std::string path;
};

AudioFileReader::AudioFileReader(): _impl(std::make_unique<Impl>())
{
}

AudioFileReader::~AudioFileReader()
{
    close();
}

auto AudioFileReader::open(std::string_view path, const StreamFormat& format) -> VoidResult
{
    close();

    if (format.sampleRate == 0)
        return makeError(ErrorCode::ConfigError, "sampleRate must be > 0");

    auto const config = ma_decoder_config_init(ma_format_f32, 1, format.sampleRate);
    _impl->path = std::string(path);

    auto const result = ma_decoder_init_file(_impl->path.c_str(), &config, &_impl->decoder);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::IoError,
                         std::format("Cannot open audio file '{}': {} ({})",
                                     path,
                                     ma_result_description(result),
                                     static_cast<int>(result)));

    _impl->initialized = true;

    if (auto const frames = totalFrames())
        log::info("Opened '{}' ({} frames, {} Hz, mono, float32)", path, *frames, format.sampleRate);
    else
        log::info("Opened '{}' ({} Hz, mono, float32)", path, format.sampleRate);
    return {};
}

auto AudioFileReader::read(const ChunkCallback& callback, std::uint32_t chunkFrames) -> Result<std::uint64_t>
{
    if (!_impl->initialized)
        return makeError(ErrorCode::AudioError, "Audio file not open");
    if (chunkFrames == 0)
        return makeError(ErrorCode::InvalidArgument, "chunkFrames must be > 0");

    auto buffer = std::vector<float>(chunkFrames);
    auto total = std::uint64_t { 0 };

    while (true)
    {
        auto framesRead = ma_uint64 { 0 };
        auto const result = ma_decoder_read_pcm_frames(&_impl->decoder, buffer.data(), chunkFrames, &framesRead);

        if (framesRead > 0)
        {
            callback(std::span<const float>(buffer.data(), static_cast<std::size_t>(framesRead)));
            total += framesRead;
        }

        if (result == MA_AT_END || framesRead == 0)
            break;

        if (result != MA_SUCCESS)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to decode '{}': {} ({})",
                                         _impl->path,
                                         ma_result_description(result),
                                         static_cast<int>(result)));
    }

    log::debug("Decoded {} frames from '{}'", total, _impl->path);
    return total;
}

auto AudioFileReader::totalFrames() const -> std::optional<std::uint64_t>
{
    if (!_impl->initialized)
        return std::nullopt;

    auto length = ma_uint64 { 0 };
    if (ma_decoder_get_length_in_pcm_frames(&_impl->decoder, &length) != MA_SUCCESS || length == 0)
        return std::nullopt;
    return static_cast<std::uint64_t>(length);
}

auto AudioFileReader::isOpen() const -> bool
{
    return _impl->initialized;
}

void AudioFileReader::close()
{
    if (!_impl->initialized)
        return;

    ma_decoder_uninit(&_impl->decoder);
    _impl->initialized = false;
}

} // namespace vadkit
