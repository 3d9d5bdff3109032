/**
 * @file ToneMixer.hpp
 * @brief Sums every sounding pluck into the device block.
 */

#ifndef FRETBOARD_TONE_MIXER_HPP
#define FRETBOARD_TONE_MIXER_HPP

#include "dsp/PluckTone.hpp"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace fretboard {

/**
 * @brief Accumulates scheduled tones into a single mono output.
 *
 * schedule() may be called from the quiz thread while render() runs on the
 * audio thread; new tones wait in a pending list that render() drains under
 * a short lock. Finished tones are dropped after the block that ends them.
 * Output is clamped to [-1, 1] as a master safety limit.
 */
class ToneMixer {
public:
    static constexpr size_t MAX_BLOCK_SIZE = 1024;

    /**
     * @param start_frame Output frame at which the tone's onset lands.
     */
    void schedule(std::shared_ptr<PluckTone> tone, uint64_t start_frame) {
        if (!tone) return;
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.push_back(Scheduled{std::move(tone), start_frame});
    }

    /**
     * @brief Render one block whose first sample is output frame block_start.
     */
    void render(std::span<float> output, uint64_t block_start) {
        std::fill(output.begin(), output.end(), 0.0f);
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            for (auto& item : pending_) {
                active_.push_back(std::move(item));
            }
            pending_.clear();
        }

        float scratch[MAX_BLOCK_SIZE];
        const uint64_t block_end = block_start + output.size();

        for (auto& item : active_) {
            if (item.start_frame >= block_end) continue;

            const size_t offset = item.start_frame > block_start
                ? static_cast<size_t>(item.start_frame - block_start) : 0;
            size_t pos = offset;
            while (pos < output.size()) {
                const size_t frames = std::min(MAX_BLOCK_SIZE, output.size() - pos);
                std::span<float> scratch_span(scratch, frames);
                item.tone->pull(scratch_span);
                for (size_t i = 0; i < frames; ++i) {
                    output[pos + i] += scratch[i];
                }
                pos += frames;
            }
        }

        active_.erase(std::remove_if(active_.begin(), active_.end(),
                                     [](const Scheduled& s) { return s.tone->is_finished(); }),
                      active_.end());
        active_count_.store(active_.size(), std::memory_order_relaxed);

        // Master Safety Clamp
        for (float& sample : output) {
            sample = std::clamp(sample, -1.0f, 1.0f);
        }
    }

    /**
     * @brief Tones still sounding as of the last render, plus those waiting.
     */
    size_t active_count() {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        return active_count_.load(std::memory_order_relaxed) + pending_.size();
    }

private:
    struct Scheduled {
        std::shared_ptr<PluckTone> tone;
        uint64_t start_frame;
    };

    std::mutex pending_mutex_;
    std::vector<Scheduled> pending_;
    std::vector<Scheduled> active_;
    std::atomic<size_t> active_count_{0};
};

} // namespace fretboard

#endif // FRETBOARD_TONE_MIXER_HPP
