/**
 * @file handctl_replay.cpp
 * @brief Offline replay of a recorded landmark stream through the gesture pipeline
 *
 * Feeds every admitted tick of a YAML recording into GesturePipeline and
 * prints stable-gesture onsets, pinch selections and camera control
 * deltas, followed by a session report. No camera or detector is needed,
 * which makes it useful for tuning thresholds against captured sessions.
 *
 * @copyright 2025 handctl Project
 * @license MIT License
 */

#include <handctl/handctl.h>
#include <opencv2/imgcodecs.hpp>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <map>
#include <sstream>
#include <stdexcept>

using namespace handctl;

namespace {

struct ReplayOptions {
    std::string recording_file;
    std::string config_file;
    std::string overlay_dir;
    float pan_speed = 25.0f;
    float zoom_speed = 100.0f;
    bool debug = false;
    core::LogLevel log_level = core::LogLevel::INFO;
};

struct ReplayStatistics {
    std::size_t ticks = 0;
    std::size_t hand_ticks = 0;
    std::size_t pinch_events = 0;
    std::map<gesture::GestureLabel, int> onset_histogram;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <recording.yaml> [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config, -c <file>      YAML configuration (gesture: section)" << std::endl;
    std::cout << "  --pan-speed <val>        Pan multiplier (default: 25)" << std::endl;
    std::cout << "  --zoom-speed <val>       Zoom multiplier (default: 100)" << std::endl;
    std::cout << "  --debug, -d              Print the debug label of every tick" << std::endl;
    std::cout << "  --log-level <level>      trace|debug|info|warning|error|critical" << std::endl;
    std::cout << "  --overlay <dir>          Write a debug overlay image per tick" << std::endl;
    std::cout << "  --help, -h               Show this help message" << std::endl;
}

bool parse_float(const std::string& text, float& value) {
    try {
        std::size_t consumed = 0;
        value = std::stof(text, &consumed);
        return consumed == text.size();
    } catch (const std::logic_error&) {
        return false;
    }
}

std::string format_point(const cv::Point2f& p) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << "(" << p.x << ", " << p.y << ")";
    return oss.str();
}

/**
 * @brief Print one tick's notable outputs
 */
void print_tick(std::size_t index, double video_time, const gesture::TickOutput& out, bool debug) {
    std::ostringstream prefix;
    prefix << "[" << std::setw(5) << index << " @ " << std::fixed << std::setprecision(3)
           << video_time << "s] ";

    if (out.gesture_onset && out.stable_gesture) {
        std::cout << prefix.str() << "STABLE " << gesture::gesture_label_to_string(*out.stable_gesture)
                  << std::endl;
    }
    if (out.pinch_event) {
        std::cout << prefix.str() << "PINCH at " << format_point(*out.pinch_event) << std::endl;
    }
    if (out.pan_delta.x != 0.0f || out.pan_delta.y != 0.0f) {
        std::cout << prefix.str() << "pan " << format_point(out.pan_delta) << std::endl;
    }
    if (out.zoom_delta != 0.0f) {
        std::cout << prefix.str() << "zoom " << std::setprecision(4) << out.zoom_delta << std::endl;
    }
    if (debug && out.debug_label) {
        std::cout << prefix.str() << *out.debug_label
                  << "  rot=" << std::setprecision(4) << out.rotation_speed << std::endl;
    }
}

void print_statistics(const ReplayStatistics& stats,
                      const gesture::FrameGate& gate,
                      const gesture::GesturePipeline& pipeline) {
    std::size_t ticks_processed = 0;
    double avg_tick_us = 0.0;
    pipeline.get_performance_stats(ticks_processed, avg_tick_us);

    std::cout << "\n";
    std::cout << "=========================================" << std::endl;
    std::cout << "         REPLAY SESSION REPORT" << std::endl;
    std::cout << "=========================================" << std::endl;
    std::cout << "Recorded ticks:       " << stats.ticks << std::endl;
    std::cout << "Admitted ticks:       " << gate.admitted_frames() << std::endl;
    std::cout << "Duplicate frames:     " << gate.skipped_frames() << std::endl;
    std::cout << "Ticks with hand:      " << stats.hand_ticks << std::endl;
    std::cout << "Pinch selections:     " << stats.pinch_events << std::endl;
    std::cout << "Avg tick time:        " << std::fixed << std::setprecision(2)
              << avg_tick_us << " us (" << ticks_processed << " ticks)" << std::endl;
    std::cout << "=========================================" << std::endl;

    if (!stats.onset_histogram.empty()) {
        std::cout << "\nStable Gesture Histogram:" << std::endl;
        std::cout << "---------------------------------------" << std::endl;
        for (const auto& entry : stats.onset_histogram) {
            std::cout << "  " << std::setw(20) << std::left
                      << gesture::gesture_label_to_string(entry.first)
                      << ": " << entry.second << std::endl;
        }
        std::cout << std::right;
        std::cout << "=========================================" << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    ReplayOptions options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) {
                options.config_file = argv[++i];
            }
        } else if (arg == "--pan-speed") {
            if (i + 1 < argc && !parse_float(argv[++i], options.pan_speed)) {
                std::cerr << "ERROR: Invalid value for --pan-speed: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--zoom-speed") {
            if (i + 1 < argc && !parse_float(argv[++i], options.zoom_speed)) {
                std::cerr << "ERROR: Invalid value for --zoom-speed: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--log-level") {
            if (i + 1 < argc) {
                std::string level = argv[++i];
                if (!core::parseLogLevel(level, options.log_level)) {
                    std::cerr << "ERROR: Unknown log level: " << level << std::endl;
                    return 1;
                }
            }
        } else if (arg == "--overlay") {
            if (i + 1 < argc) {
                options.overlay_dir = argv[++i];
            }
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && options.recording_file.empty()) {
            options.recording_file = arg;
        } else {
            std::cerr << "ERROR: Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (options.recording_file.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    core::Logger::getInstance().setLevel(options.log_level);

    try {
        // 1. Configuration
        core::Configuration& configuration = core::Configuration::getInstance();
        if (!options.config_file.empty() && !configuration.load(options.config_file)) {
            std::cerr << "ERROR: " << configuration.getLastError() << std::endl;
            return 1;
        }

        gesture::GesturePipelineConfig config = gesture::load_pipeline_config(configuration);
        if (options.debug) {
            config.debug_labels = true;
        }

        // 2. Recording
        std::vector<gesture::RecordedTick> recording =
            gesture::load_landmark_recording(options.recording_file);

        std::cout << "\n";
        std::cout << "=========================================" << std::endl;
        std::cout << "        HANDCTL GESTURE REPLAY" << std::endl;
        std::cout << "=========================================" << std::endl;
        std::cout << "  Recording:        " << options.recording_file << std::endl;
        std::cout << "  Ticks:            " << recording.size() << std::endl;
        std::cout << "  Config:           "
                  << (options.config_file.empty() ? "defaults" : options.config_file) << std::endl;
        std::cout << "  Pan/zoom speed:   " << options.pan_speed << " / " << options.zoom_speed << std::endl;
        std::cout << "  Overlay:          "
                  << (options.overlay_dir.empty() ? "Disabled" : options.overlay_dir) << std::endl;
        std::cout << "=========================================\n" << std::endl;

        // 3. Replay
        gesture::GesturePipeline pipeline(config);
        gesture::FrameGate gate;

        // Recorded wall times are replayed on a synthetic steady clock
        const gesture::FrameGate::Clock::time_point origin{};
        gate.reset(origin);

        ReplayStatistics stats;
        cv::Mat canvas;

        for (std::size_t i = 0; i < recording.size(); ++i) {
            const gesture::RecordedTick& tick = recording[i];
            stats.ticks++;

            auto now = origin + std::chrono::duration_cast<gesture::FrameGate::Clock::duration>(
                std::chrono::duration<double>(tick.wall_time));

            std::optional<float> elapsed = gate.admit(tick.video_time, now);
            if (!elapsed) {
                continue;
            }

            gesture::TickInput input;
            input.landmarks = tick.landmarks;
            input.elapsed_seconds = *elapsed;
            input.interaction_locked = tick.locked;
            input.pan_speed = options.pan_speed;
            input.zoom_speed = options.zoom_speed;

            gesture::TickOutput output = pipeline.process(input);

            if (tick.landmarks) {
                stats.hand_ticks++;
            }
            if (output.gesture_onset && output.stable_gesture) {
                stats.onset_histogram[*output.stable_gesture]++;
            }
            if (output.pinch_event) {
                stats.pinch_events++;
            }

            print_tick(i, tick.video_time, output, options.debug);

            if (!options.overlay_dir.empty()) {
                canvas = cv::Mat::zeros(480, 640, CV_8UC3);
                gesture::draw_debug_overlay(canvas, tick.landmarks, output);

                std::ostringstream name;
                name << options.overlay_dir << "/tick_" << std::setw(5) << std::setfill('0') << i << ".png";
                if (!cv::imwrite(name.str(), canvas)) {
                    LOG_WARNING("Failed to write overlay image " + name.str());
                }
            }
        }

        print_statistics(stats, gate, pipeline);
        std::cout << "\nReplay completed successfully!" << std::endl;

    } catch (const core::Exception& e) {
        std::cerr << "\nERROR: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\nException occurred: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
