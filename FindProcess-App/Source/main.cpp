#include "utils/FinderApp.hpp"
#include "utils/CliArgs.hpp"
#include "utils/ResultJson.hpp"
#include "utils/Log.hpp"
#include "Core/Process/ExeName.hpp"
#include "Core/Process/SnapshotError.hpp"
#include "Core/Process/ToolhelpSnapshot.hpp"
#include <windows.h>
#include <crtdbg.h>
#include <cstdlib>
#include <cwchar>
#include <exception>
#include <fmt/format.h>

static std::string WideToUtf8(const wchar_t* ws) {
    if (!ws) return "(null)";
    const std::u16string u(ws, ws + wcslen(ws));   // wchar_t è UTF-16 su Windows
    return FindProcess::DecodeExeName(u.data(), u.size());
}

static void __cdecl OnInvalidParameter(
    const wchar_t* expr, const wchar_t* func, const wchar_t* file,
    unsigned line, uintptr_t) {
    // logga sempre (Release incluso)
    LOGF("[CRT INVALID PARAM] expr='{}' func='{}' file='{}' line={}",
        WideToUtf8(expr), WideToUtf8(func), WideToUtf8(file), line);
}

int main(int argc, char** argv) {
    _set_invalid_parameter_handler(OnInvalidParameter);
    _set_abort_behavior(0, _WRITE_ABORT_MSG | _CALL_REPORTFAULT);

    const std::string prog = argc > 0 && argv[0] ? argv[0] : "findprocess";

    try {
        CliOptions cli;
        std::string err;
        if (!ParseCommandLine(argc, argv, cli, err)) {
            fmt::print(stderr, "{}\n{}", err, UsageText(prog));
            return kExitUsage;
        }
        if (cli.help) {
            fmt::print("{}", UsageText(prog));
            return kExitAllRunning;
        }

        AppConfig cfg;
        if (!BuildAppConfig(cli, cfg, err)) {
            LOGF("[CONFIG] {}", err);
            fmt::print("{}\n", ResultJson::Fail("config_invalid", err).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
            return kExitUsage;
        }

        FinderApp app{ std::move(cfg), FindProcess::ToolhelpSnapshotApi() };
        std::string doc;
        const int code = app.run(doc);
        fmt::print("{}\n", doc);
        return code;
    }
    catch (const fmt::format_error& e) {
        LOGF("[FATAL] fmt::format_error: {}", e.what());
        return kExitOther;
    }
    catch (const FindProcess::SnapshotError& e) {
        LOGF("[FATAL] snapshot ({}): {} (code {})", FindProcess::StageName(e.stage()), e.what(), (int)e.code().value());
        return kExitSnapshot;
    }
    catch (const std::system_error& e) {
        LOGF("[FATAL] std::system_error: {} (code {})", e.what(), (int)e.code().value());
        return kExitOther;
    }
    catch (const std::exception& e) {
        LOGF("[FATAL] std::exception: {}", e.what());
        return kExitOther;
    }
    catch (...) {
        LOGF("[FATAL] eccezione sconosciuta");
        return kExitOther;
    }
}
