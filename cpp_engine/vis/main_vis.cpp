// main_vis.cpp
// Dashboard driver for the solar-to-hydrogen simulation.
// - Wall clock (glfwGetTime) -> FrameClock -> Simulation::tick(dt), one tick per frame
// - Control console: configuration sliders, learner toggle/epsilon/cadence, Start/Pause/Reset
// - Sliders read back the live configuration so learner decisions are visible
// - Rate / yield plots are fed from the simulation's per-second telemetry ring

#include <vector>
#include <string>
#include <cmath>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstdint>

#include "Simulation.h"
#include "FrameClock.h"

#include "imgui.h"
// ---- Docking compatibility shim (older ImGui builds do not define docking flags/APIs)
#ifndef ImGuiConfigFlags_DockingEnable
#define SOLARSYNTH_NO_IMGUI_DOCKING 1
#endif
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

// Platform GL headers: on Windows, <GL/gl.h> requires Windows types/macros (APIENTRY/WINGDIAPI).
// Include <windows.h> first to avoid syntax errors in the Windows SDK gl.h.
#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#endif

#include <GLFW/glfw3.h>

#ifdef __APPLE__
#  include <OpenGL/gl.h>
#else
#  include <GL/gl.h>
#endif

static void glfw_error_callback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description ? description : "(null)");
}

static int fail(const char* msg) {
    std::fprintf(stderr, "FATAL: %s\n", msg ? msg : "(null)");
    std::fprintf(stderr, "\n");
    return EXIT_FAILURE;
}

struct VisualUIState {
    bool show_hud = true;
    bool show_controls = true;
    bool show_plots = true;
};

// Control-surface mirror of the simulation inputs (widget-owned floats).
struct ControlSurface {
    float tilt_deg = 30.0f;
    float electrolyte_pct = 1.0f;
    float epsilon = 0.2f;
    int cadence_s = 5;
    bool learner_enabled = false;
};

static ImVec4 run_state_color(solarsynth::RunState s) {
    switch (s) {
        case solarsynth::RunState::Running: return ImVec4(0.2f, 1.0f, 0.4f, 1.0f);
        case solarsynth::RunState::Paused:  return ImVec4(1.0f, 0.8f, 0.2f, 1.0f);
        default:                            return ImVec4(0.7f, 0.7f, 0.7f, 1.0f);
    }
}

static void plot_line_with_xlimits(const char* title,
                                  const char* label,
                                  const double* xs,
                                  const double* ys,
                                  int count,
                                  double t0,
                                  double t1)
{
    if (count <= 1)
        return;

    if (ImPlot::BeginPlot(title)) {

        // --- X-axis handling (robust across ImPlot versions) ---
#if defined(ImAxis_X1)
        // ImPlot >= 0.16
        ImPlot::SetupAxisLimits(ImAxis_X1, t0, t1, ImGuiCond_Always);
#elif defined(ImPlotAxis_X1)
        // Transitional versions
        ImPlot::SetupAxisLimits(ImPlotAxis_X1, t0, t1, ImGuiCond_Always);
#else
        // Very old ImPlot: DO NOT set limits (auto-fit fallback)
#endif

        ImPlot::PlotLine(label, xs, ys, count);

        ImPlot::EndPlot();
    }
}

int main(int argc, char** argv) {
    // --- CLI flags ---
    solarsynth::SimConfigV1 cfg;
    bool autostart = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? argv[i] : "";
        if (arg == "--autostart") {
            autostart = true;
        } else if (arg == "--learner") {
            cfg.learner_enabled = true;
        } else if (arg == "--seed" && i + 1 < argc) {
            cfg.seed_u32 = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else {
            std::fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            std::fprintf(stderr, "usage: SolarSynthVis [--autostart] [--learner] [--seed n]\n");
            return EXIT_FAILURE;
        }
    }

    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1280, 720, "SolarSynth Dashboard", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return fail("glfwCreateWindow failed");
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    // Validate OpenGL context exists.
    const GLubyte* gl_version = glGetString(GL_VERSION);
    if (!gl_version) {
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("OpenGL context validation failed (glGetString(GL_VERSION) returned null)");
    }
    std::fprintf(stderr, "OpenGL Vendor:   %s\n", glGetString(GL_VENDOR));
    std::fprintf(stderr, "OpenGL Renderer: %s\n", glGetString(GL_RENDERER));
    std::fprintf(stderr, "OpenGL Version:  %s\n", gl_version);

    bool imgui_ctx = false;
    bool implot_ctx = false;
    bool imgui_glfw = false;
    bool imgui_gl3 = false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_ctx = true;

    ImGuiIO& io = ImGui::GetIO();
#ifndef SOLARSYNTH_NO_IMGUI_DOCKING
    io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;
#endif
    (void)io;

    ImPlot::CreateContext();
    implot_ctx = true;

    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplGlfw_InitForOpenGL failed");
    }
    imgui_glfw = true;

    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplOpenGL3_Init failed");
    }
    imgui_gl3 = true;

    solarsynth::Simulation sim(cfg);
    solarsynth::FrameClock frame_clock;

    VisualUIState ui;
    ControlSurface ctl;
    ctl.tilt_deg = (float)sim.configuration().tilt_deg;
    ctl.electrolyte_pct = (float)sim.configuration().electrolyte_pct;
    ctl.epsilon = (float)sim.learner().epsilon();
    ctl.cadence_s = (int)std::lround(sim.learner().decisionCadence_s());
    ctl.learner_enabled = sim.learnerEnabled();

    if (autostart) sim.start();

    // Best read-out is only reformatted when the learner's best changes.
    std::uint32_t best_rev_seen = 0xFFFFFFFFu;
    char best_tilt_txt[32] = "-";
    char best_elec_txt[32] = "-";
    char best_rate_txt[32] = "-";

    // History buffers (mirrors of the telemetry ring)
    std::vector<solarsynth::TelemetrySample> telemetry(4096);
    std::vector<double> t_hist, rate_hist, yield_hist, lux_hist;
    t_hist.reserve(telemetry.size());
    rate_hist.reserve(telemetry.size());
    yield_hist.reserve(telemetry.size());
    lux_hist.reserve(telemetry.size());
    int telemetry_seen = -1;
    double telemetry_t_last = -1.0;

    auto refresh_history = [&]() {
        const int n = sim.getTelemetrySamples(telemetry.data(), (int)telemetry.size());
        const double t_last = (n > 0) ? (double)telemetry[(size_t)n - 1].t_s : -1.0;
        if (n == telemetry_seen && t_last == telemetry_t_last) return;
        telemetry_seen = n;
        telemetry_t_last = t_last;

        t_hist.clear(); rate_hist.clear(); yield_hist.clear(); lux_hist.clear();
        for (int i = 0; i < n; ++i) {
            const auto& s = telemetry[(size_t)i];
            t_hist.push_back(s.t_s);
            rate_hist.push_back(s.rate_mL_per_min);
            yield_hist.push_back(s.yield_mL);
            lux_hist.push_back(s.lux);
        }
    };

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        // --- advance sim: exactly one tick per frame, first delta is 0 ---
        const double dt = frame_clock.advance(glfwGetTime());
        sim.tick(dt);

        const solarsynth::Observation obs = sim.observe();

        // Read back configuration (learner decisions move the sliders).
        ctl.tilt_deg = (float)obs.tilt_deg;
        ctl.electrolyte_pct = (float)obs.electrolyte_pct;

        if (obs.best_revision_u32 != best_rev_seen) {
            best_rev_seen = obs.best_revision_u32;
            if (obs.best.valid) {
                std::snprintf(best_tilt_txt, sizeof(best_tilt_txt), "%d deg", obs.best.bin.tilt_deg);
                std::snprintf(best_elec_txt, sizeof(best_elec_txt), "%.1f %%", obs.best.bin.electrolytePct());
                std::snprintf(best_rate_txt, sizeof(best_rate_txt), "%.2f mL/min", obs.best.reward);
            } else {
                std::snprintf(best_tilt_txt, sizeof(best_tilt_txt), "-");
                std::snprintf(best_elec_txt, sizeof(best_elec_txt), "-");
                std::snprintf(best_rate_txt, sizeof(best_rate_txt), "-");
            }
        }

        refresh_history();

        // --- ImGui frame ---
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

#ifndef SOLARSYNTH_NO_IMGUI_DOCKING
        ImGui::DockSpaceOverViewport(ImGui::GetMainViewport());
#endif

        const ImVec4 header_col(0.35f, 0.85f, 1.0f, 1.0f);

        if (ui.show_hud) {
            ImGuiWindowFlags dashboard_flags =
                ImGuiWindowFlags_NoDecoration |
                ImGuiWindowFlags_AlwaysAutoResize |
                ImGuiWindowFlags_NoSavedSettings |
                ImGuiWindowFlags_NoFocusOnAppearing |
                ImGuiWindowFlags_NoNav;
            ImGui::SetNextWindowPos(ImVec2(10.0f, 10.0f), ImGuiCond_Always);
            ImGui::SetNextWindowBgAlpha(0.85f);
            if (ImGui::Begin("##Dashboard", &ui.show_hud, dashboard_flags)) {
                ImGui::TextColored(header_col, "[ SOLAR SYNTH ]");
                ImGui::Separator();
                ImGui::Text("TIME:  %d:%02d", obs.elapsed_min, obs.elapsed_sec);
                ImGui::SameLine();
                ImGui::TextColored(run_state_color(obs.run_state), "[%s]", solarsynth::runStateText(obs.run_state));

                ImGui::TextColored(header_col, "=== PRODUCTION ===");
                ImGui::Text("Lux:        %d", obs.lux);
                ImGui::Text("Sun angle:  %.1f deg", obs.sun_angle_deg);
                ImGui::Text("Tilt eff:   %.0f %%", 100.0 * obs.tilt_eff_0_1);
                ImGui::Text("Elec eff:   %.0f %%", 100.0 * obs.elec_eff_0_1);
                ImGui::Text("H2 rate:    %.2f mL/min", obs.rate_mL_per_min);
                ImGui::Text("H2 total:   %.1f mL", obs.yield_mL);

                ImGui::TextColored(header_col, "=== LEARNER ===");
                ImGui::Text("Best tilt:  %s", best_tilt_txt);
                ImGui::Text("Best elec:  %s", best_elec_txt);
                ImGui::Text("Best rate:  %s", best_rate_txt);
                ImGui::Text("Bins: %zu  Decisions: %llu (%s)",
                            obs.memory_bins,
                            (unsigned long long)obs.decisions,
                            solarsynth::suggestionReasonText(obs.last_suggestion));
            }
            ImGui::End();
        }

        if (ui.show_controls) {
            ImGui::Begin(">> CONTROL CONSOLE", &ui.show_controls);

            ImGui::TextColored(header_col, "[EXEC] Transport Controls");
            if (ImGui::Button("  START  ", ImVec2(100, 0))) {
                sim.start();
            }
            ImGui::SameLine();
            if (ImGui::Button("  PAUSE  ", ImVec2(100, 0))) {
                sim.pause();
            }
            ImGui::SameLine();
            if (ImGui::Button(" RESET ", ImVec2(100, 0))) {
                // Reset restores the configuration currently shown on the sliders.
                sim.setDefaultConfiguration({(double)ctl.tilt_deg, (double)ctl.electrolyte_pct});
                sim.reset();
                frame_clock.reset();
                best_rev_seen = 0xFFFFFFFFu;
            }

            ImGui::Separator();
            ImGui::TextColored(header_col, "[CONFIG] Panel + Cell");
            if (ImGui::SliderFloat("Tilt (deg)", &ctl.tilt_deg, 0.0f, 60.0f, "%.0f")) {
                sim.setConfiguration({(double)ctl.tilt_deg, (double)ctl.electrolyte_pct});
            }
            if (ImGui::SliderFloat("Electrolyte (%)", &ctl.electrolyte_pct, 0.0f, 2.0f, "%.1f")) {
                sim.setConfiguration({(double)ctl.tilt_deg, (double)ctl.electrolyte_pct});
            }

            ImGui::Separator();
            ImGui::TextColored(header_col, "[LEARNER] Epsilon-greedy");
            if (ImGui::Checkbox("Learner enabled", &ctl.learner_enabled)) {
                sim.setLearnerEnabled(ctl.learner_enabled);
            }
            if (ImGui::SliderFloat("Epsilon", &ctl.epsilon, 0.0f, 1.0f, "%.2f")) {
                sim.setEpsilon(ctl.epsilon);
            }
            if (ImGui::InputInt("Decision period (s)", &ctl.cadence_s)) {
                sim.setDecisionCadence_s((double)ctl.cadence_s);
                // Show the clamped value back on the widget.
                ctl.cadence_s = (int)std::lround(sim.learner().decisionCadence_s());
            }

            ImGui::Separator();
            ImGui::Checkbox("Show plots", &ui.show_plots);
            ImGui::Text("Samples: %d", (int)t_hist.size());

            ImGui::End();
        }

        if (ui.show_plots) {
            ImGui::Begin("Telemetry", &ui.show_plots);
            const int count = (int)t_hist.size();
            const double t0 = count > 0 ? t_hist.front() : 0.0;
            const double t1 = count > 0 ? std::max(t_hist.back(), t0 + 1.0) : 1.0;
            plot_line_with_xlimits("H2 rate (mL/min)", "rate", t_hist.data(), rate_hist.data(), count, t0, t1);
            plot_line_with_xlimits("H2 total (mL)", "yield", t_hist.data(), yield_hist.data(), count, t0, t1);
            plot_line_with_xlimits("Irradiance (lux)", "lux", t_hist.data(), lux_hist.data(), count, t0, t1);
            ImGui::End();
        }

        ImGui::Render();

        int display_w = 0, display_h = 0;
        glfwGetFramebufferSize(window, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(0.06f, 0.08f, 0.11f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window);
    }

    // Cleanup
    if (implot_ctx) ImPlot::DestroyContext();
    if (imgui_gl3) ImGui_ImplOpenGL3_Shutdown();
    if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
    if (imgui_ctx) ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
