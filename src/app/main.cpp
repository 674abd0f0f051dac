// kara: karaoke syllable-timing editor.
//
// Opens a GLFW/Vulkan window drawn with Dear ImGui, or with --headless runs
// the same edit session against a key script. On quit the document is
// written to stdout.

#include <cstdint>
#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <kara/logger.hpp>
#include <sstream>
#include <string>

#include "ui/edit_session.hpp"
#include "ui/key_script.hpp"
#include "ui/keymap_config.hpp"

#if defined(KARA_USE_GLFW) && defined(KARA_USE_IMGUI)
    #include <algorithm>

    #include "render/vulkan/vk_context.hpp"
    #include "ui/editor_window.hpp"
    #include "ui/glfw_adapter.hpp"
#endif

namespace
{

struct Options
{
    bool        headless = false;
    bool        verbose  = false;
    std::string script_path;
    std::string keymap_path;
};

void print_usage()
{
    fprintf(stderr,
            "Usage: kara [options]\n"
            "  --headless          Run without a window, driven by a key script\n"
            "  --script <path>     Key script for --headless (default: stdin)\n"
            "  --keymap <path>     Keymap overrides (JSON)\n"
            "  --verbose           Debug logging\n"
            "  --help              Show this help\n");
}

// Returns 0 to continue, 1 on bad arguments, -1 after --help.
int parse_args(int argc, char** argv, Options& opts)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--headless")
            opts.headless = true;
        else if (arg == "--script" && i + 1 < argc)
        {
            opts.script_path = argv[++i];
            opts.headless    = true;
        }
        else if (arg == "--keymap" && i + 1 < argc)
            opts.keymap_path = argv[++i];
        else if (arg == "--verbose" || arg == "-v")
            opts.verbose = true;
        else if (arg == "--help" || arg == "-h")
        {
            print_usage();
            return -1;
        }
        else
        {
            fprintf(stderr, "kara: unrecognized argument '%s'\n", arg.c_str());
            print_usage();
            return 1;
        }
    }
    return 0;
}

bool apply_keymap_file(const std::string& path, kara::EditSession& session)
{
    kara::KeymapConfig config;
    if (!config.load(path))
    {
        KARA_LOG_ERROR("app", "cannot load keymap '{}'", path);
        return false;
    }
    size_t skipped = config.apply_overrides(session.keymap());
    if (skipped > 0)
        KARA_LOG_WARN("app", "{} keymap override(s) skipped", skipped);
    KARA_LOG_INFO("app", "applied {} keymap override(s)", config.override_count() - skipped);
    return true;
}

int run_headless(const Options& opts, kara::EditSession& session)
{
    std::string source;
    if (opts.script_path.empty())
    {
        source.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    else
    {
        std::ifstream in(opts.script_path);
        if (!in)
        {
            KARA_LOG_ERROR("app", "cannot open script '{}'", opts.script_path);
            return 1;
        }
        std::stringstream ss;
        ss << in.rdbuf();
        source = ss.str();
    }

    kara::KeyScript script = kara::parse_key_script(source);
    if (!script.error.empty())
    {
        KARA_LOG_ERROR("app", "script: {}", script.error);
        return 1;
    }

    size_t ran = kara::run_key_script(script, session);
    KARA_LOG_DEBUG("app", "ran {} of {} script steps", ran, script.steps.size());
    return 0;
}

#if defined(KARA_USE_GLFW) && defined(KARA_USE_IMGUI)

int run_window(const Options& opts, kara::EditSession& session)
{
    kara::GlfwAdapter window;
    if (!window.open(kara::WindowConfig{}))
        return 1;

    // Installed before ImGui so its GLFW backend chains our callbacks.
    window.set_event_handler([&session](const kara::KeyEvent& event)
                             { session.handle_key(event); });

    kara::vk::VulkanContext context;
    context.init(window.handle(), opts.verbose);

    kara::EditorWindow editor;
    if (!editor.init(context, window.handle()))
    {
        context.shutdown();
        return 1;
    }

    double last = kara::GlfwAdapter::now();
    while (!session.quit_requested())
    {
        if (!window.pump(0.016))
        {
            KARA_LOG_INFO("app", "window closed");
            break;
        }

        double now = kara::GlfwAdapter::now();
        session.update(static_cast<float>(std::min(now - last, 0.25)));
        last = now;

        uint32_t width  = window.framebuffer_width();
        uint32_t height = window.framebuffer_height();
        if (width == 0 || height == 0)
            continue;   // minimized

        if (window.take_resize() || context.needs_rebuild())
            context.resize(width, height);

        context.render_frame(editor.build_frame(session));
        context.present_frame();
    }

    context.wait_idle();
    editor.shutdown();
    context.shutdown();
    window.close();
    return 0;
}

#endif

}   // namespace

int main(int argc, char** argv)
{
    Options opts;
    int     parsed = parse_args(argc, argv, opts);
    if (parsed != 0)
        return parsed < 0 ? 0 : 1;

    auto& logger = kara::Logger::instance();
    logger.set_level(opts.verbose ? kara::LogLevel::Debug : kara::LogLevel::Info);
    logger.add_sink(kara::sinks::console_sink());

    try
    {
        kara::EditSession session;

        if (!opts.keymap_path.empty() && !apply_keymap_file(opts.keymap_path, session))
            return 1;

        int status = 0;
        if (opts.headless)
        {
            status = run_headless(opts, session);
        }
        else
        {
#if defined(KARA_USE_GLFW) && defined(KARA_USE_IMGUI)
            status = run_window(opts, session);
#else
            KARA_LOG_ERROR("app", "built without a window front end; use --headless");
            status = 1;
#endif
        }

        if (status != 0)
            return status;

        std::cout << session.export_document() << std::flush;
        return 0;
    }
    catch (const std::exception& e)
    {
        KARA_LOG_CRITICAL("app", "{}", e.what());
        return 1;
    }
}
