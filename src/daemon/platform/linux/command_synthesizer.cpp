#include "platform/linux/command_synthesizer.hpp"

#include "platform/subprocess.hpp"

CommandSynthesizer::CommandSynthesizer(std::vector<std::string> command)
    : command_(std::move(command)) {}

std::vector<std::string> CommandSynthesizer::build_argv(const std::string& voice) const {
    static constexpr std::string_view kVoice = "{voice}";
    std::vector<std::string> argv;
    argv.reserve(command_.size());
    for (auto arg : command_) {
        for (auto pos = arg.find(kVoice); pos != std::string::npos; pos = arg.find(kVoice, pos)) {
            arg.replace(pos, kVoice.size(), voice);
            pos += voice.size();
        }
        argv.push_back(std::move(arg));
    }
    return argv;
}

StageResult<void> CommandSynthesizer::speak(const std::string& text, const std::string& voice,
                                            std::stop_token stop) {
    if (command_.empty()) return std::unexpected(StageError::failure("no speech command configured"));
    if (stop.stop_requested()) return std::unexpected(StageError::cancelled());

    auto res = platform::run_process(build_argv(voice), text, stop);
    if (!res) return std::unexpected(StageError::failure(res.error()));
    if (res->killed) return std::unexpected(StageError::cancelled());
    if (res->code != 0) {
        return std::unexpected(StageError::failure(
            command_.front() + " exited with code " + std::to_string(res->code)));
    }
    return {};
}
