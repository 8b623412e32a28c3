// src/ui/ImGuiLayer.cpp
#include "ui/ImGuiLayer.h"

#include "ui/SDLDetect.h"
#include "util/PathUtf8.h"

// ---------- Dear ImGui: core + SDL2/SDL_Renderer2 backend includes ----------
#include <imgui.h>

#if __has_include(<imgui/backends/imgui_impl_sdl2.h>)
  #include <imgui/backends/imgui_impl_sdl2.h>
  #include <imgui/backends/imgui_impl_sdlrenderer2.h>
#elif __has_include(<backends/imgui_impl_sdl2.h>)
  #include <backends/imgui_impl_sdl2.h>
  #include <backends/imgui_impl_sdlrenderer2.h>
#elif __has_include(<imgui_impl_sdl2.h>)
  #include <imgui_impl_sdl2.h>
  #include <imgui_impl_sdlrenderer2.h>
#else
  #error "imgui_impl_sdl2.h not found. Ensure Dear ImGui 'backends' are present and on the include path."
#endif
// ---------------------------------------------------------------------------

#include <spdlog/spdlog.h>

#include <cmath>
#include <system_error>

using namespace ghostledger::ui;

// Base font size at scale 1.0.
#ifndef GHOSTLEDGER_IMGUI_BASE_FONT_PX
  #define GHOSTLEDGER_IMGUI_BASE_FONT_PX 15.0f
#endif

namespace {

void ApplyFontScale(float scale)
{
    if (!(scale > 0.0f))
        scale = 1.0f;

    ImGuiIO& io = ImGui::GetIO();
    io.Fonts->Clear();

    ImFontConfig cfg;
    cfg.SizePixels = GHOSTLEDGER_IMGUI_BASE_FONT_PX * scale;
    io.Fonts->AddFontDefault(&cfg);

    if (std::fabs(scale - 1.0f) > 0.01f)
        ImGui::GetStyle().ScaleAllSizes(scale);
}

} // namespace

bool ImGuiLayer::initialize(SDL_Window* window, SDL_Renderer* renderer,
                            const std::filesystem::path& iniDir, float fontScale)
{
    if (m_initialized)
        return true;

    if (!window || !renderer)
        return false;

    m_window = window;
    m_renderer = renderer;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();

    ImGui::StyleColorsDark();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.ConfigWindowsMoveFromTitleBarOnly = true;

    // io.IniFilename must outlive the context.
    io.IniFilename = nullptr;
    if (!iniDir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(iniDir, ec);
        if (!ec)
        {
            m_iniUtf8 = ghostledger::util::PathToUtf8String(iniDir / "imgui.ini");
            io.IniFilename = m_iniUtf8.c_str();
        }
        else
        {
            spdlog::warn("ui: imgui.ini disabled ({})", ec.message());
        }
    }

    if (!ImGui_ImplSDL2_InitForSDLRenderer(m_window, m_renderer))
    {
        ImGui::DestroyContext();
        return false;
    }
    if (!ImGui_ImplSDLRenderer2_Init(m_renderer))
    {
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        return false;
    }

    ApplyFontScale(fontScale);

    spdlog::info("ui: Dear ImGui {} ready", ImGui::GetVersion());
    m_initialized = true;
    return true;
}

void ImGuiLayer::shutdown()
{
    if (!m_initialized)
        return;

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    m_initialized = false;
    m_window = nullptr;
    m_renderer = nullptr;
}

bool ImGuiLayer::processEvent(const SDL_Event& event)
{
    if (!m_initialized)
        return false;

    ImGui_ImplSDL2_ProcessEvent(&event);

    const ImGuiIO& io = ImGui::GetIO();
    switch (event.type)
    {
    case SDL_KEYDOWN:
    case SDL_KEYUP:
    case SDL_TEXTINPUT:
        return io.WantCaptureKeyboard;
    case SDL_MOUSEMOTION:
    case SDL_MOUSEBUTTONDOWN:
    case SDL_MOUSEBUTTONUP:
    case SDL_MOUSEWHEEL:
        return io.WantCaptureMouse;
    default:
        return false;
    }
}

void ImGuiLayer::newFrame()
{
    if (!m_initialized)
        return;

    ImGui_ImplSDLRenderer2_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();
}

void ImGuiLayer::render()
{
    if (!m_initialized)
        return;

    ImGui::Render();

    const ImGuiIO& io = ImGui::GetIO();
    SDL_RenderSetScale(m_renderer, io.DisplayFramebufferScale.x, io.DisplayFramebufferScale.y);
    SDL_SetRenderDrawColor(m_renderer, 24, 24, 28, 255);
    SDL_RenderClear(m_renderer);
    ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), m_renderer);
    SDL_RenderPresent(m_renderer);
}
