#define MA_NO_DECODING
#define MA_NO_ENCODING
#define MINIAUDIO_IMPLEMENTATION
#include "c8vm_audio.hpp"

#include "c8vm_log.hpp"

namespace c8vm::audio {

std::unique_ptr<audio_context> audio_context::create()
{
    auto ctx = std::unique_ptr<audio_context>(new audio_context());

    ctx->square_wave_config =
        ma_waveform_config_init(DEVICE_FORMAT, DEVICE_CHANNELS, DEVICE_SAMPLE_RATE,
                                ma_waveform_type_square, SQUARE_WAVE_AMPLITUDE,
                                SQUARE_WAVE_FREQUENCY);

    ma_waveform_init(&ctx->square_wave_config, &ctx->square_wave);

    ctx->device_config = ma_device_config_init(ma_device_type_playback);
    ctx->device_config.playback.format = DEVICE_FORMAT;
    ctx->device_config.playback.channels = DEVICE_CHANNELS;
    ctx->device_config.sampleRate = DEVICE_SAMPLE_RATE;
    ctx->device_config.pUserData = &ctx->square_wave;

    ctx->device_config.dataCallback = [](ma_device* pDevice, void* pOutput,
                                         const void* /* pInput */, ma_uint32 frameCount) {
        ma_waveform* pSquareWave;

        MA_ASSERT(pDevice->playback.channels == audio_context::DEVICE_CHANNELS);

        pSquareWave = (ma_waveform*)pDevice->pUserData;
        MA_ASSERT(pSquareWave != NULL);

        ma_waveform_read_pcm_frames(pSquareWave, pOutput, frameCount);
    };

    if (ma_device_init(NULL, &ctx->device_config, &ctx->device) != MA_SUCCESS) {
        log::warn("failed to open audio playback device");
        return nullptr;
    }

    ctx->init_success = true;

    log::info("audio device name: %s", ctx->device.playback.name);

    return ctx;
}

void audio_context::start_beep(void)
{
    if (beeping) return;

    if (ma_device_start(&device) != MA_SUCCESS) {
        log::warn("failed to start playback device");
        return;
    }
    beeping = true;
}

void audio_context::stop_beep(void)
{
    if (!beeping) return;

    if (ma_device_stop(&device) != MA_SUCCESS) {
        log::warn("failed to stop playback device");
        return;
    }
    beeping = false;
}

} // namespace c8vm::audio
