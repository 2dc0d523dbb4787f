#include "viewer.hpp"

#include <algorithm>

#include <imgui.h>
#include <rlImGui.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

Viewer::Viewer(const mailbox::IntensityGrid &grid,
               const mailbox::EngineConfigSnapshot &cfg, PolicyKind policy,
               const RenderConfig &rcfg)
    : m_grid(grid), m_cfg(cfg), m_policy(policy), m_renderer(rcfg) {
    restart();
}

Viewer::~Viewer() {
    m_driver.reset();
    m_sim.reset();
}

void Viewer::restart() {
    LOG_INFO("Viewer: starting run with the {} policy",
             policy_name(m_policy));

    m_driver.reset();
    m_sim = std::make_unique<Simulation>(m_grid, m_cfg);
    m_driver = std::make_unique<FrameDriver>(*m_sim,
                                             make_policy(m_policy, *m_sim));
    m_frame = m_driver->next_frame();
    m_accumulator = 0.f;
}

bool Viewer::advance() {
    auto frame = m_driver->next_frame();
    if (!frame) {
        return false;
    }
    m_frame = std::move(frame);
    return true;
}

void Viewer::upload() {
    if (!m_frame) {
        return;
    }
    const Image &image = m_renderer.render(*m_frame);

    if (m_texture.id == 0 || m_texture.width != image.width ||
        m_texture.height != image.height) {
        if (m_texture.id != 0) {
            UnloadTexture(m_texture);
        }
        m_texture = LoadTextureFromImage(image);
        return;
    }
    UpdateTexture(m_texture, image.data);
}

void Viewer::run() {
    const auto &layout = m_frame ? m_frame->layout : mailbox::GridLayout{};
    const int width = (int)layout.image_width + PANEL_WIDTH;
    const int height = std::max((int)layout.image_height, 320);

    SetConfigFlags(FLAG_WINDOW_RESIZABLE);
    InitWindow(width, height, "gridbreak");
    if (!IsWindowReady()) {
        throw gridbreak::RenderError("Failed to open the viewer window");
    }
    SetTargetFPS(60);
    rlImGuiSetup(true);
    ImGui::GetIO().IniFilename = nullptr;

    upload();

    const float frame_seconds = m_cfg.timing.frame_duration_ms / 1000.f;

    while (!WindowShouldClose()) {
        bool changed = false;

        if (IsKeyPressed(KEY_SPACE)) {
            m_paused = !m_paused;
        }
        if (IsKeyPressed(KEY_R)) {
            restart();
            changed = true;
        }

        if (m_step_once) {
            changed |= advance();
            m_step_once = false;
        } else if (!m_paused) {
            m_accumulator += GetFrameTime();
            while (m_accumulator >= frame_seconds) {
                m_accumulator -= frame_seconds;
                if (!advance()) {
                    m_accumulator = 0.f;
                    break;
                }
                changed = true;
            }
        }

        if (changed) {
            upload();
        }

        BeginDrawing();
        ClearBackground(m_renderer.config().background_color);
        if (m_texture.id != 0) {
            DrawTexture(m_texture, PANEL_WIDTH, 0, WHITE);
        }

        rlImGuiBegin();
        draw_panel();
        rlImGuiEnd();

        EndDrawing();
    }

    if (m_texture.id != 0) {
        UnloadTexture(m_texture);
        m_texture = {};
    }
    rlImGuiShutdown();
    CloseWindow();
}

void Viewer::draw_panel() {
    ImGui::SetNextWindowPos(ImVec2{0.f, 0.f}, ImGuiCond_Always);
    ImGui::SetNextWindowSize(
        ImVec2{(float)PANEL_WIDTH, (float)GetScreenHeight()}, ImGuiCond_Always);
    ImGui::Begin("gridbreak", nullptr,
                 ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize |
                     ImGuiWindowFlags_NoCollapse);

    const RunReport &report = m_driver->report();

    ImGui::SeparatorText("Run");
    ImGui::Text("Policy: %s", policy_name(m_policy).data());
    ImGui::Text("Frame: %lld  Step: %lld", report.frames,
                m_frame ? m_frame->frame_index : 0LL);
    ImGui::Text("Bricks: %d / %d", m_sim->destroyed_count(),
                m_sim->total_bricks());
    ImGui::Text("Targets: %d (%d abandoned)", report.targets,
                report.abandoned_targets);
    if (m_driver->finished()) {
        ImGui::Text("Stopped: %s", stop_reason_name(report.stop_reason));
    } else {
        ImGui::TextUnformatted("Running");
    }

    ImGui::SeparatorText("Controls");
    if (ImGui::Button(m_paused ? "Resume" : "Pause")) {
        m_paused = !m_paused;
    }
    ImGui::SameLine();
    ImGui::BeginDisabled(!m_paused);
    if (ImGui::Button("Step")) {
        m_step_once = true;
    }
    ImGui::EndDisabled();
    ImGui::SameLine();
    if (ImGui::Button("Restart")) {
        restart();
        upload();
    }

    if (m_frame && !m_frame->explosions.empty()) {
        ImGui::Text("Explosions: %d", (int)m_frame->explosions.size());
    }

    ImGui::End();
}
