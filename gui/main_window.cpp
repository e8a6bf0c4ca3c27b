#include "AudioEngine.hpp"
#include "constellation_processor.hpp"
#include "constellation_settings.hpp"
#include "constellation_settings_io.hpp"
#include "normalization.hpp"
#include "views/constellation_view.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// ImGui + OpenGL ES 3 (Pi 4)
#include <GLES3/gl3.h>
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>

using namespace constellation;
using constellation::audio::AudioEngine;
using constellation::dsp::ConstellationProcessor;

struct CommandLine {
    std::string config_path = "config/constellation.json";
    std::string save_path;
    std::string device;
    std::string mode;   // "" keeps the file's value
    bool verbose = false;
};

static void print_usage(const char* argv0) {
    std::cout << "Spectral Constellation\n"
              << "Usage: " << argv0 << " [options]\n"
              << "  --config <path>       Settings file (default: config/constellation.json)\n"
              << "  --device <name>       ALSA capture device\n"
              << "  --adaptive            Adaptive (local median) peak detection\n"
              << "  --fixed               Fixed threshold peak detection\n"
              << "  --save-config <path>  Write the effective settings and exit\n"
              << "  --verbose             Print a status line once per second\n"
              << "  --help                Show this help\n";
}

class ConstellationGUI {
public:
    ConstellationGUI(const ConstellationSettings& st, bool verbose)
        : settings(st), verbose(verbose), normalizer(to_normalization_config(st)) {
        processor = std::make_unique<ConstellationProcessor>(settings);

        AudioConfig audio_config;
        audio_config.device_name = settings.audio_device;
        audio_config.sample_rate = static_cast<unsigned int>(settings.sample_rate);
        audio_config.period_size = static_cast<unsigned int>(settings.period_size);

        audio_engine = std::make_unique<AudioEngine>(audio_config);
        audio_engine->set_process_callback([this](const float* input, int num_samples) {
            processor->push_samples(input, num_samples);
        });
    }

    bool init_gui() {
        if (!glfwInit()) return false;

        // Request OpenGL ES 3.0 context via EGL
        glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_ES_API);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

        window = glfwCreateWindow(1200, 800, "Spectral Constellation", nullptr, nullptr);
        if (!window) {
            glfwTerminate();
            return false;
        }

        glfwMakeContextCurrent(window);
        glfwSwapInterval(1); // Enable vsync

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        ImGuiIO& io = ImGui::GetIO(); (void)io;
        io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

        ImGui::StyleColorsDark();

        ImGui_ImplGlfw_InitForOpenGL(window, true);
        ImGui_ImplOpenGL3_Init("#version 300 es");
        return true;
    }

    int run() {
        if (!init_gui()) {
            std::cerr << "Failed to create window\n";
            return 1;
        }

        start_audio();

        while (!glfwWindowShouldClose(window)) {
            glfwPollEvents();

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            update_constellation();
            render_gui();

            ImGui::Render();
            int display_w, display_h;
            glfwGetFramebufferSize(window, &display_w, &display_h);
            glViewport(0, 0, display_w, display_h);
            glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

            glfwSwapBuffers(window);
        }

        audio_engine->stop();
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return 0;
    }

private:
    GLFWwindow* window = nullptr;
    ConstellationSettings settings;
    bool verbose;

    Normalizer normalizer;
    std::unique_ptr<ConstellationProcessor> processor;
    std::unique_ptr<AudioEngine> audio_engine;
    gui::ConstellationView constellation_view;

    // Display data, refreshed every UI frame
    std::vector<ConstellationPoint> points;
    std::vector<ConstellationPoint> current_points;
    dsp::SpectrumSnapshot last_spectrum;
    double last_status_time = -1.0;
    std::string status_message;

    bool start_audio() {
        if (!audio_engine->negotiated() && !audio_engine->negotiate()) {
            status_message = "No usable capture device";
            return false;
        }
        if (!adopt_device_rate()) return false;
        if (!audio_engine->start()) {
            status_message = "Failed to start audio";
            std::cerr << "Failed to start audio\n";
            return false;
        }
        status_message.clear();
        return true;
    }

    // Frequencies must follow the rate the device actually runs at
    bool adopt_device_rate() {
        const double actual_rate = static_cast<double>(audio_engine->sample_rate());
        if (actual_rate == settings.sample_rate) return true;

        ConstellationSettings adjusted = settings;
        adjusted.sample_rate = actual_rate;
        std::string error;
        if (!validate_settings(adjusted, error)) {
            status_message = "Unsupported device rate: " + error;
            std::cerr << status_message << std::endl;
            return false;
        }
        settings = adjusted;
        processor = std::make_unique<ConstellationProcessor>(settings);
        std::cout << "Analyzer rebuilt for " << actual_rate << " Hz" << std::endl;
        return true;
    }

    void stop_audio() {
        audio_engine->stop();
        processor->reset_frame();
    }

    void update_constellation() {
        const double now = processor->now();
        processor->prune(now);
        points = normalizer.project_all(processor->snapshot(now));

        current_points.clear();
        for (const auto& p : processor->current_peaks()) {
            // Only highlight peaks that are still on screen
            if (now - p.timestamp <= settings.fade_horizon) {
                current_points.push_back(normalizer.project(FadedPeak{p, 1.0f}));
            }
        }

        processor->try_get_spectrum(last_spectrum);

        if (verbose && now - last_status_time >= 1.0) {
            last_status_time = now;
            print_status(now);
        }
    }

    void print_status(double now) const {
        const DistributionStats d = compute_distribution(points);
        const auto stats = processor->store().stats();
        const auto lat = audio_engine->get_latency_stats();
        std::cout << "[" << now << "s] frames=" << processor->frames_processed()
                  << " stars=" << d.count
                  << " x=[" << d.x_min << "," << d.x_max << "]"
                  << " y=[" << d.y_min << "," << d.y_max << "]"
                  << " quad=" << d.quadrant[0] << "/" << d.quadrant[1] << "/"
                  << d.quadrant[2] << "/" << d.quadrant[3]
                  << " admitted=" << stats.admitted
                  << " aged=" << stats.evicted_by_age
                  << " capped=" << stats.evicted_by_capacity
                  << " xruns=" << lat.xruns << std::endl;
    }

    void render_gui() {
        const ImGuiViewport* vp = ImGui::GetMainViewport();
        ImGui::SetNextWindowPos(vp->WorkPos);
        ImGui::SetNextWindowSize(vp->WorkSize);
        ImGui::Begin("Constellation", nullptr,
                     ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize |
                     ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoCollapse);

        const bool running = audio_engine->is_running();
        if (ImGui::Button(running ? "Stop" : "Start")) {
            if (running) stop_audio();
            else start_audio();
        }
        ImGui::SameLine();
        ImGui::Checkbox("Grid", &constellation_view.show_grid);
        ImGui::SameLine();
        ImGui::Checkbox("Glow", &constellation_view.show_glow);
        ImGui::SameLine();
        ImGui::Checkbox("Highlight latest", &constellation_view.highlight_current);

        const auto& cfg = audio_engine->get_config();
        ImGui::Text("Detection: %s | Window: %s | N=%d hop=%d | %.0f Hz",
                    detection_mode_name(processor->detector().mode()),
                    settings.window_type.c_str(),
                    processor->frame_length(), processor->hop_length(),
                    settings.sample_rate);
        ImGui::Text("Peaks (latest): %d | Stars: %d | Frames: %llu | Samples: %llu",
                    last_spectrum.valid ? last_spectrum.peak_count : 0,
                    static_cast<int>(points.size()),
                    static_cast<unsigned long long>(processor->frames_processed()),
                    static_cast<unsigned long long>(audio_engine->samples_captured()));
        if (running) {
            const auto lat = audio_engine->get_latency_stats();
            ImGui::Text("Device: %s | Callback %.2f/%.2f/%.2f ms (min/avg/max) | XRuns: %d",
                        cfg.device_name.c_str(), lat.min_ms, lat.avg_ms, lat.max_ms, lat.xruns);
        } else {
            ImGui::TextDisabled("Capture stopped");
        }
        if (!status_message.empty()) {
            ImGui::TextColored(ImVec4(1.0f, 0.4f, 0.4f, 1.0f), "%s", status_message.c_str());
        }

        ImGui::Separator();

        const ImVec2 canvas_pos = ImGui::GetCursorScreenPos();
        const ImVec2 avail = ImGui::GetContentRegionAvail();
        const float width = avail.x;
        const float height = std::max(100.0f, avail.y);
        constellation_view.draw(ImGui::GetWindowDrawList(), canvas_pos, width, height,
                                points, current_points, normalizer);
        ImGui::Dummy(ImVec2(width, height));

        ImGui::End();
    }
};

int main(int argc, char* argv[]) {
    CommandLine cl;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            cl.config_path = argv[++i];
        } else if (arg == "--save-config" && i + 1 < argc) {
            cl.save_path = argv[++i];
        } else if (arg == "--device" && i + 1 < argc) {
            cl.device = argv[++i];
        } else if (arg == "--adaptive") {
            cl.mode = "adaptive";
        } else if (arg == "--fixed") {
            cl.mode = "fixed";
        } else if (arg == "--verbose") {
            cl.verbose = true;
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    ConstellationSettings settings;
    if (!load_settings(cl.config_path.c_str(), settings)) {
        std::cout << "No settings at " << cl.config_path << ", using defaults" << std::endl;
    }
    if (!cl.device.empty()) settings.audio_device = cl.device;
    if (!cl.mode.empty()) settings.detection_mode = cl.mode;

    std::string error;
    if (!validate_settings(settings, error)) {
        std::cerr << "Invalid settings: " << error << std::endl;
        return 1;
    }

    if (!cl.save_path.empty()) {
        if (!save_settings(cl.save_path.c_str(), settings)) {
            std::cerr << "Failed to write " << cl.save_path << std::endl;
            return 1;
        }
        std::cout << "Settings written to " << cl.save_path << std::endl;
        return 0;
    }

    try {
        ConstellationGUI app(settings, cl.verbose);
        return app.run();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
}
