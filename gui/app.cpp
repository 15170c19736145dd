// gui/app.cpp
// SDL2 + Dear ImGui host: window, keypad, 40 Hz tone, and a small control panel
#include <atomic>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>
#include <cstdint>

#include <SDL.h>

#include "imgui.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_sdlrenderer2.h"  // SDL2 renderer v2 backend

#include "cpu.hpp"
#include "options.hpp"
#include "scheduler.hpp"

// 1 2 3 4 / Q W E R / A S D F / Z X C V  ->  1 2 3 C / 4 5 6 D / 7 8 9 E / A 0 B F
static int mapKey(SDL_Scancode sc) {
    switch (sc) {
        case SDL_SCANCODE_1: return 0x1;
        case SDL_SCANCODE_2: return 0x2;
        case SDL_SCANCODE_3: return 0x3;
        case SDL_SCANCODE_4: return 0xC;
        case SDL_SCANCODE_Q: return 0x4;
        case SDL_SCANCODE_W: return 0x5;
        case SDL_SCANCODE_E: return 0x6;
        case SDL_SCANCODE_R: return 0xD;
        case SDL_SCANCODE_A: return 0x7;
        case SDL_SCANCODE_S: return 0x8;
        case SDL_SCANCODE_D: return 0x9;
        case SDL_SCANCODE_F: return 0xE;
        case SDL_SCANCODE_Z: return 0xA;
        case SDL_SCANCODE_X: return 0x0;
        case SDL_SCANCODE_C: return 0xB;
        case SDL_SCANCODE_V: return 0xF;
        default:             return -1;
    }
}

// Square wave on an SDL audio device. The callback runs on SDL's audio thread.
class SdlSpeaker : public Speaker {
public:
    static constexpr int MIXRATE = 48000;

    bool open() {
        SDL_AudioSpec want{};
        want.freq     = MIXRATE;
        want.format   = AUDIO_F32SYS;
        want.channels = 1;
        want.samples  = 512;
        want.callback = &SdlSpeaker::callback;
        want.userdata = this;
        m_dev = SDL_OpenAudioDevice(nullptr, 0, &want, nullptr, 0);
        if (!m_dev) {
            std::fprintf(stderr, "SDL_OpenAudioDevice failed: %s\n", SDL_GetError());
            return false;
        }
        SDL_PauseAudioDevice(m_dev, 0);
        return true;
    }

    void close() {
        if (m_dev) SDL_CloseAudioDevice(m_dev);
        m_dev = 0;
    }

    void play(double frequency_hz) override {
        if (m_on.load()) return;
        m_step.store(static_cast<float>(frequency_hz / MIXRATE));
        m_on.store(true);
    }

    void stop() override { m_on.store(false); }

private:
    static void callback(void* u, uint8_t* stream, int bytes) {
        SdlSpeaker& s = *static_cast<SdlSpeaker*>(u);
        float* out = reinterpret_cast<float*>(stream);
        int    len = bytes / static_cast<int>(sizeof(float));
        bool   on  = s.m_on.load();
        float  step = s.m_step.load();
        for (int i = 0; i < len; ++i) {
            if (!on) { out[i] = 0.0f; continue; }
            s.m_phase += step;
            s.m_phase -= static_cast<int>(s.m_phase);
            out[i] = s.m_phase < 0.5f ? 0.15f : -0.15f;
        }
    }

    SDL_AudioDeviceID  m_dev{0};
    std::atomic<bool>  m_on{false};
    std::atomic<float> m_step{0.0f};
    float              m_phase{0.0f}; // audio thread only
};

class SdlScreen : public Renderer {
public:
    SdlScreen(SDL_Renderer* r, int scale) : m_r(r), m_scale(scale) {}

    void render(const Framebuffer& fb) override {
        SDL_SetRenderDrawColor(m_r, 0, 0, 0, 255);
        SDL_RenderClear(m_r);
        SDL_SetRenderDrawColor(m_r, 230, 230, 230, 255);
        for (int y = 0; y < Framebuffer::HEIGHT; ++y)
            for (int x = 0; x < Framebuffer::WIDTH; ++x)
                if (fb.get(x, y)) {
                    SDL_Rect px{ x * m_scale, y * m_scale, m_scale, m_scale };
                    SDL_RenderFillRect(m_r, &px);
                }
    }

private:
    SDL_Renderer* m_r;
    int           m_scale;
};

int main(int argc, char** argv) {
    Options opt;
    std::string err;
    if (!parse_options(std::vector<std::string>(argv + 1, argv + argc), opt, err)) {
        std::fprintf(stderr, "[chip8] %s\n%s", err.c_str(), usage_text());
        return 1;
    }

    CPU cpu;
    if (!boot(cpu, opt)) return 1;

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_AUDIO | SDL_INIT_TIMER) != 0) {
        std::fprintf(stderr, "SDL Error: %s\n", SDL_GetError());
        return 1;
    }

    const int winW = Framebuffer::WIDTH * opt.scale;
    const int winH = Framebuffer::HEIGHT * opt.scale;
    SDL_Window* window = SDL_CreateWindow(
        "chip8vm",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        winW, winH,
        SDL_WINDOW_ALLOW_HIGHDPI);
    if (!window) { std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError()); SDL_Quit(); return 1; }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1,
        SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) { std::fprintf(stderr, "SDL_CreateRenderer failed: %s\n", SDL_GetError()); SDL_DestroyWindow(window); SDL_Quit(); return 1; }

    // --- ImGui init ---
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;
    ImGui::StyleColorsDark();

    if (!ImGui_ImplSDL2_InitForSDLRenderer(window, renderer)) {
        std::fprintf(stderr, "ImGui_ImplSDL2_InitForSDLRenderer failed\n");
        SDL_DestroyRenderer(renderer); SDL_DestroyWindow(window); SDL_Quit(); return 1;
    }
    if (!ImGui_ImplSDLRenderer2_Init(renderer)) {
        std::fprintf(stderr, "ImGui_ImplSDLRenderer2_Init failed\n");
        ImGui_ImplSDL2_Shutdown(); SDL_DestroyRenderer(renderer); SDL_DestroyWindow(window); SDL_Quit(); return 1;
    }

    SdlSpeaker speaker;
    if (!speaker.open()) std::fprintf(stderr, "[chip8] no audio device, running silent\n");
    SdlScreen  screen(renderer, opt.scale);

    Scheduler sched(cpu, speaker, screen);
    sched.speed = opt.speed;
    sched.start(Scheduler::Clock::now());

    bool running = true;
    bool paused  = false;
    bool showPanel = true;
    bool reported = false;

    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT) running = false;
            if (event.type == SDL_KEYDOWN && !event.key.repeat) {
                if (event.key.keysym.scancode == SDL_SCANCODE_ESCAPE) running = false;
                else if (event.key.keysym.scancode == SDL_SCANCODE_F1) showPanel = !showPanel;
                else if (!io.WantCaptureKeyboard) {
                    int k = mapKey(event.key.keysym.scancode);
                    if (k >= 0) cpu.key_down(static_cast<uint8_t>(k));
                }
            }
            if (event.type == SDL_KEYUP) {
                int k = mapKey(event.key.keysym.scancode);
                if (k >= 0) cpu.key_up(static_cast<uint8_t>(k));
            }
        }

        // tick() only draws on processed frames; every present needs the display
        if (paused) {
            speaker.stop();
            screen.render(cpu.display);
        }
        else if (!sched.tick(Scheduler::Clock::now())) {
            screen.render(cpu.display);
        }

        if (cpu.halted && !reported) {
            std::fprintf(stderr, "[chip8] halted: %s (opcode %04X at %04X)\n",
                         fault_name(cpu.fault), cpu.fault_opcode, cpu.fault_pc);
            speaker.stop();
            reported = true;
        }

        ImGui_ImplSDLRenderer2_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        if (showPanel) {
            ImGui::SetNextWindowPos(ImVec2(8, 8), ImGuiCond_FirstUseEver);
            ImGui::SetNextWindowBgAlpha(0.75f);
            ImGui::Begin("chip8vm (F1)", &showPanel, ImGuiWindowFlags_AlwaysAutoResize);
            ImGui::Text("%s", opt.rom_path.c_str());
            ImGui::SetNextItemWidth(120);
            ImGui::SliderInt("instr/frame", &sched.speed, 1, 100);
            ImGui::Checkbox("Pause", &paused); ImGui::SameLine();
            if (ImGui::Button("Reset")) {
                if (!boot(cpu, opt)) running = false;
                sched.start(Scheduler::Clock::now());
                reported = false;
            }
            if (cpu.halted)
                ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "Halted: %s", fault_name(cpu.fault));
            else if (cpu.mode == ExecMode::AwaitingKey)
                ImGui::Text("Waiting for key");
            ImGui::End();
        }

        ImGui::Render();
        ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
        SDL_RenderPresent(renderer);
    }

    speaker.close();
    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
