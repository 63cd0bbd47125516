#include "dialog/DialogBackend.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include "utils/ScopedTempFile.h"
#include <cstdint>

namespace {
constexpr int ZENITY_CANCEL = 1;
constexpr int ZENITY_TIMEOUT = 5;

std::string chompNewlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

std::string titleOrDefault(const DialogRequest& request) {
    return request.title.empty() ? "Tether" : request.title;
}

void requireLaunched(const CommandResult& result, const std::string& backend) {
    if (!result.launched) {
        throw TetherError(ErrorKind::DialogFailure, backend + " could not be started");
    }
}
} // namespace

// ==================== zenity ====================

ZenityDialogBackend::ZenityDialogBackend(std::shared_ptr<ICommandRunner> runner)
    : runner(std::move(runner)) {}

std::string ZenityDialogBackend::escapeMarkup(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out += c; break;
        }
    }
    return out;
}

DialogAnswer ZenityDialogBackend::show(const DialogRequest& request) {
    std::vector<std::string> argv = {"zenity"};
    switch (request.kind) {
        case DialogKind::FreeText: argv.push_back("--entry"); break;
        case DialogKind::YesNo: argv.push_back("--question"); break;
        case DialogKind::InfoOnly: argv.push_back("--info"); break;
    }
    argv.push_back("--title=" + titleOrDefault(request));
    argv.push_back("--text=" + escapeMarkup(request.bodyText));

    CommandResult result = runner->run(argv);
    requireLaunched(result, "zenity");

    DialogAnswer answer;
    answer.source = AnswerSource::Fallback;
    switch (request.kind) {
        case DialogKind::FreeText:
            if (result.exitCode == 0) {
                answer.text = chompNewlines(result.output);
                answer.answered = !answer.text.empty();
            } else if (result.exitCode != ZENITY_CANCEL && result.exitCode != ZENITY_TIMEOUT) {
                throw TetherError(ErrorKind::DialogFailure, "zenity exited with " + std::to_string(result.exitCode));
            }
            break;
        case DialogKind::YesNo:
            if (result.exitCode == 0 || result.exitCode == ZENITY_CANCEL) {
                answer.answered = true;
                answer.confirmed = result.exitCode == 0;
            } else if (result.exitCode != ZENITY_TIMEOUT) {
                throw TetherError(ErrorKind::DialogFailure, "zenity exited with " + std::to_string(result.exitCode));
            }
            break;
        case DialogKind::InfoOnly:
            if (result.exitCode < 0) {
                throw TetherError(ErrorKind::DialogFailure, "zenity terminated abnormally");
            }
            answer.answered = true;
            answer.confirmed = true;
            break;
    }
    return answer;
}

// ==================== osascript ====================

OsaScriptDialogBackend::OsaScriptDialogBackend(std::shared_ptr<ICommandRunner> runner)
    : runner(std::move(runner)) {}

std::string OsaScriptDialogBackend::escapeAppleScript(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\\' || c == '"') out += '\\';
        out += c;
    }
    return out;
}

std::string OsaScriptDialogBackend::buildScript(const DialogRequest& request) {
    std::string title = escapeAppleScript(titleOrDefault(request));
    std::string body = escapeAppleScript(request.bodyText);

    switch (request.kind) {
        case DialogKind::FreeText:
            return "try\n"
                   "set dialogResult to display dialog \"" + body + "\" default answer \"\" "
                   "buttons {\"Cancel\", \"OK\"} default button \"OK\" cancel button \"Cancel\" "
                   "with title \"" + title + "\" with icon note\n"
                   "return \"OK:\" & (text returned of dialogResult)\n"
                   "on error number -128\n"
                   "return \"CANCEL\"\n"
                   "end try";
        case DialogKind::YesNo:
            return "set dialogResult to display dialog \"" + body + "\" "
                   "buttons {\"No\", \"Yes\"} default button \"Yes\" "
                   "with title \"" + title + "\" with icon caution\n"
                   "if button returned of dialogResult is \"Yes\" then\n"
                   "return \"true\"\n"
                   "else\n"
                   "return \"false\"\n"
                   "end if";
        case DialogKind::InfoOnly:
            return "display dialog \"" + body + "\" buttons {\"OK\"} default button \"OK\" "
                   "with title \"" + title + "\" with icon note\n"
                   "return \"ok\"";
    }
    return "";
}

DialogAnswer OsaScriptDialogBackend::show(const DialogRequest& request) {
    CommandResult result = runner->run({"osascript", "-e", buildScript(request)});
    requireLaunched(result, "osascript");
    if (result.exitCode != 0) {
        throw TetherError(ErrorKind::DialogFailure, "osascript exited with " + std::to_string(result.exitCode));
    }

    std::string output = chompNewlines(result.output);
    DialogAnswer answer;
    answer.source = AnswerSource::Fallback;
    switch (request.kind) {
        case DialogKind::FreeText:
            if (output.rfind("OK:", 0) == 0) {
                answer.text = output.substr(3);
                answer.answered = !answer.text.empty();
            }
            break;
        case DialogKind::YesNo:
            answer.answered = true;
            answer.confirmed = output == "true";
            break;
        case DialogKind::InfoOnly:
            answer.answered = true;
            answer.confirmed = true;
            break;
    }
    return answer;
}

// ==================== PowerShell ====================

PowerShellDialogBackend::PowerShellDialogBackend(std::shared_ptr<ICommandRunner> runner)
    : runner(std::move(runner)) {}

std::string PowerShellDialogBackend::escapeSingleQuoted(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\'') out += "''";
        else if (c == '`') out += "``";
        else out += c;
    }
    return out;
}

std::string PowerShellDialogBackend::buildScript(const DialogRequest& request, const std::string& resultPath) {
    std::string title = escapeSingleQuoted(titleOrDefault(request));
    std::string body = escapeSingleQuoted(request.bodyText);
    std::string target = escapeSingleQuoted(resultPath);

    switch (request.kind) {
        case DialogKind::FreeText:
            return "Add-Type -AssemblyName Microsoft.VisualBasic\n"
                   "$result = [Microsoft.VisualBasic.Interaction]::InputBox('" + body + "', '" + title + "', '')\n"
                   "$result | Out-File -FilePath '" + target + "' -Encoding UTF8";
        case DialogKind::YesNo:
            return "Add-Type -AssemblyName System.Windows.Forms\n"
                   "$result = [System.Windows.Forms.MessageBox]::Show('" + body + "', '" + title + "', "
                   "[System.Windows.Forms.MessageBoxButtons]::YesNo, [System.Windows.Forms.MessageBoxIcon]::Question)\n"
                   "if ($result -eq [System.Windows.Forms.DialogResult]::Yes) {\n"
                   "    'true' | Out-File -FilePath '" + target + "' -Encoding UTF8\n"
                   "} else {\n"
                   "    'false' | Out-File -FilePath '" + target + "' -Encoding UTF8\n"
                   "}";
        case DialogKind::InfoOnly:
            return "Add-Type -AssemblyName System.Windows.Forms\n"
                   "[System.Windows.Forms.MessageBox]::Show('" + body + "', '" + title + "', "
                   "[System.Windows.Forms.MessageBoxButtons]::OK, [System.Windows.Forms.MessageBoxIcon]::Information) | Out-Null\n"
                   "'ok' | Out-File -FilePath '" + target + "' -Encoding UTF8";
    }
    return "";
}

std::string PowerShellDialogBackend::encodeCommand(const std::string& script) {
    // UTF-8 解码为码点, 非法字节记作 U+FFFD
    std::string utf16;
    auto pushUnit = [&utf16](uint32_t unit) {
        utf16 += static_cast<char>(unit & 0xFF);
        utf16 += static_cast<char>((unit >> 8) & 0xFF);
    };
    size_t i = 0;
    while (i < script.size()) {
        auto byte = static_cast<unsigned char>(script[i]);
        uint32_t cp = 0xFFFD;
        size_t len = 1;
        if (byte < 0x80) {
            cp = byte;
        } else if ((byte & 0xE0) == 0xC0) {
            len = 2;
            cp = byte & 0x1F;
        } else if ((byte & 0xF0) == 0xE0) {
            len = 3;
            cp = byte & 0x0F;
        } else if ((byte & 0xF8) == 0xF0) {
            len = 4;
            cp = byte & 0x07;
        }
        if (len > 1) {
            if (i + len > script.size()) {
                cp = 0xFFFD;
                len = 1;
            } else {
                for (size_t k = 1; k < len; ++k) {
                    auto cont = static_cast<unsigned char>(script[i + k]);
                    if ((cont & 0xC0) != 0x80) {
                        cp = 0xFFFD;
                        len = 1;
                        break;
                    }
                    cp = (cp << 6) | (cont & 0x3F);
                }
            }
        }
        i += len;

        if (cp >= 0x10000) {
            cp -= 0x10000;
            pushUnit(0xD800 + (cp >> 10));
            pushUnit(0xDC00 + (cp & 0x3FF));
        } else {
            pushUnit(cp);
        }
    }

    static const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve((utf16.size() + 2) / 3 * 4);
    for (size_t pos = 0; pos < utf16.size(); pos += 3) {
        uint32_t chunk = static_cast<unsigned char>(utf16[pos]) << 16;
        if (pos + 1 < utf16.size()) chunk |= static_cast<unsigned char>(utf16[pos + 1]) << 8;
        if (pos + 2 < utf16.size()) chunk |= static_cast<unsigned char>(utf16[pos + 2]);
        out += alphabet[(chunk >> 18) & 0x3F];
        out += alphabet[(chunk >> 12) & 0x3F];
        out += pos + 1 < utf16.size() ? alphabet[(chunk >> 6) & 0x3F] : '=';
        out += pos + 2 < utf16.size() ? alphabet[chunk & 0x3F] : '=';
    }
    return out;
}

DialogAnswer PowerShellDialogBackend::show(const DialogRequest& request) {
    ScopedTempFile resultFile("tether_dialog");

    CommandResult result = runner->run({
        "powershell", "-NoProfile", "-ExecutionPolicy", "Bypass",
        "-EncodedCommand", encodeCommand(buildScript(request, resultFile.string()))
    });
    requireLaunched(result, "powershell");
    if (!resultFile.exists()) {
        throw TetherError(ErrorKind::DialogFailure, "powershell produced no result file");
    }

    std::string output = resultFile.readTrimmed();
    DialogAnswer answer;
    answer.source = AnswerSource::Fallback;
    switch (request.kind) {
        case DialogKind::FreeText:
            answer.text = output;
            answer.answered = !output.empty();
            break;
        case DialogKind::YesNo:
            answer.answered = true;
            answer.confirmed = output == "true";
            break;
        case DialogKind::InfoOnly:
            answer.answered = true;
            answer.confirmed = true;
            break;
    }
    return answer;
}

// ==================== 选择 ====================

std::unique_ptr<IDialogBackend> makeDialogBackend(PlatformId platform, std::shared_ptr<ICommandRunner> runner) {
    switch (platform) {
        case PlatformId::Windows: return std::make_unique<PowerShellDialogBackend>(std::move(runner));
        case PlatformId::MacOS: return std::make_unique<OsaScriptDialogBackend>(std::move(runner));
        case PlatformId::Linux: return std::make_unique<ZenityDialogBackend>(std::move(runner));
    }
    return std::make_unique<ZenityDialogBackend>(std::move(runner));
}

std::unique_ptr<IDialogBackend> makeDialogBackend(const std::string& name, PlatformId platform,
                                                  std::shared_ptr<ICommandRunner> runner) {
    if (name == "zenity") return std::make_unique<ZenityDialogBackend>(std::move(runner));
    if (name == "osascript") return std::make_unique<OsaScriptDialogBackend>(std::move(runner));
    if (name == "powershell") return std::make_unique<PowerShellDialogBackend>(std::move(runner));
    if (name != "auto") {
        throw TetherError(ErrorKind::ConfigError, "Unknown dialog backend: " + name);
    }
    return makeDialogBackend(platform, std::move(runner));
}
