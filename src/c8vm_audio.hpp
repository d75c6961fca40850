#pragma once

#include <memory>

#include <miniaudio.h> // https://miniaud.io/

namespace c8vm::audio {

// Square wave beeper, played while the sound timer is nonzero.
struct audio_context {
    static constexpr auto DEVICE_FORMAT = ma_format_f32;
    static constexpr auto DEVICE_CHANNELS = 2;
    static constexpr auto DEVICE_SAMPLE_RATE = 48000;
    static constexpr auto SQUARE_WAVE_FREQUENCY = 240;
    static constexpr auto SQUARE_WAVE_AMPLITUDE = 0.25;

    ma_device device;
    ma_device_config device_config;
    ma_waveform square_wave;
    ma_waveform_config square_wave_config;
    bool init_success = false;
    bool beeping = false;

    // Returns nullptr if no playback device could be opened.
    static std::unique_ptr<audio_context> create();
    ~audio_context()
    {
        if (init_success) ma_device_uninit(&this->device);
    }

    void start_beep(void);
    void stop_beep(void);

private:
    audio_context() = default;
};

} // namespace c8vm::audio
