// SPDX-License-Identifier: Apache-2.0

#include <args/args.hxx>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

#include <caf/actor_registry.hpp>
#include <caf/actor_system.hpp>
#include <caf/scoped_actor.hpp>

#include "cuecraft/atoms.hpp"
#include "cuecraft/cue/cue.hpp"
#include "cuecraft/edit/edit_pipeline.hpp"
#include "cuecraft/global_store/global_store.hpp"
#include "cuecraft/session/session_actor.hpp"
#include "cuecraft/session/session_store.hpp"
#include "cuecraft/silence/silence_compactor.hpp"
#include "cuecraft/silence/silence_log.hpp"
#include "cuecraft/utility/helpers.hpp"
#include "cuecraft/utility/logging.hpp"
#include "cuecraft/utility/serialise_headers.hpp"
#include "cuecraft/utility/string_helpers.hpp"

using namespace caf;
using namespace cuecraft;
using namespace cuecraft::utility;

namespace {

struct CLIArguments {
    args::ArgumentParser parser = {
        "cuecraft. v" PROJECT_VERSION, "Edit subtitle timelines from the command line."};
    args::HelpFlag help = {parser, "help", "Display this help menu", {'h', "help"}};

    args::Group commands = {parser, "Commands"};
    args::Command new_cmd = {commands, "new", "Create a session and print its id"};
    args::Command sessions_cmd = {commands, "sessions", "List stored sessions"};
    args::Command remove_cmd = {commands, "remove", "Delete a session"};
    args::Command edit_cmd = {commands, "edit", "Apply an intent and parameters to a session"};
    args::Command show_cmd = {commands, "show", "Print the timeline of a session"};
    args::Command cues_cmd = {commands, "cues", "Print the time ordered cues of a session"};
    args::Command validate_cmd = {commands, "validate", "Report timing problems"};
    args::Command clear_cmd = {commands, "clear", "Remove every subtitle of a session"};
    args::Command compact_cmd = {commands, "compact", "Remove silence from a session"};
    args::Command detect_cmd = {
        commands, "detect-filter", "Print the silence detector audio filter"};

    args::Positional<std::string> new_session = {
        new_cmd, "SESSION", "Session id, generated when omitted"};
    args::Positional<std::string> remove_session = {
        remove_cmd, "SESSION", "Session id", args::Options::Required};

    args::Positional<std::string> edit_session = {
        edit_cmd, "SESSION", "Session id", args::Options::Required};
    args::Positional<std::string> edit_intent = {
        edit_cmd, "INTENT", "Intent label", args::Options::Required};
    args::Positional<std::string> edit_params = {
        edit_cmd, "PARAMS", "Parameter object, JSON text"};

    args::Positional<std::string> show_session = {
        show_cmd, "SESSION", "Session id", args::Options::Required};
    args::Positional<std::string> cues_session = {
        cues_cmd, "SESSION", "Session id", args::Options::Required};
    args::Positional<std::string> validate_session = {
        validate_cmd, "SESSION", "Session id", args::Options::Required};
    args::Positional<std::string> clear_session = {
        clear_cmd, "SESSION", "Session id", args::Options::Required};

    args::Positional<std::string> compact_session = {
        compact_cmd, "SESSION", "Session id", args::Options::Required};
    args::ValueFlag<double> duration = {
        compact_cmd, "SECONDS", "Total media duration", {"duration"}, args::Options::Required};
    args::ValueFlagList<std::string> silence = {
        compact_cmd, "START:END", "Silent interval", {"silence"}};
    args::ValueFlag<std::string> silence_log = {
        compact_cmd, "PATH", "ffmpeg silencedetect output", {"silence-log"}};

    args::Group misc = {parser, "Other options", args::Group::Validators::DontCare,
        args::Options::Global};
    args::ValueFlag<std::string> store = {
        misc, "DIR", "Session directory", {"store"}, "sessions"};
    args::ValueFlagList<std::string> cli_pref_paths = {
        misc, "PATH", "Path to preferences", {"pref"}};
    args::Flag debug                     = {misc, "debug", "Debugging mode", {"debug"}};
    args::ValueFlag<std::string> logfile = {
        misc, "PATH", "Write session log to file", {"log-file"}};

    args::CompletionFlag completion = {parser, {"complete"}};

    void parse_args(int argc, char **argv) {
        try {
            parser.ParseCLI(argc, argv);
        } catch (const args::Completion &e) {
            std::cerr << e.what();
            std::exit(EXIT_FAILURE);
        } catch (const args::Help &) {
            std::cerr << parser;
            std::exit(EXIT_SUCCESS);
        } catch (const args::ParseError &e) {
            std::cerr << e.what() << std::endl;
            std::cerr << parser;
            std::exit(EXIT_FAILURE);
        } catch (const args::ValidationError &e) {
            std::cerr << e.what() << std::endl;
            std::cerr << parser;
            std::exit(EXIT_FAILURE);
        }
    }
};

std::string read_text_file(const std::string &path) {
    std::ifstream in(path);
    if (not in.is_open())
        throw std::runtime_error("Failed to open " + path);

    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

silence::SilenceIntervals parse_silence_args(const std::vector<std::string> &items) {
    silence::SilenceIntervals result;

    for (const auto &i : items) {
        const auto parts = utility::split(i, ':');
        if (parts.size() != 2)
            throw std::runtime_error("Expected START:END, got \"" + i + "\"");

        const auto start = to_double(parts[0]);
        const auto end   = to_double(parts[1]);
        if (not start or not end or *end < *start)
            throw std::runtime_error("Invalid silent interval \"" + i + "\"");

        result.emplace_back(*start, *end);
    }

    return result;
}

struct Launcher {

    Launcher(CLIArguments &arguments, actor_system &a_system)
        : cli_args(arguments), system(a_system) {
        auto pref_paths = global_store::default_preference_paths();
        for (const auto &p : args::get(cli_args.cli_pref_paths))
            pref_paths.push_back(p);
        prefs = global_store::global_store_builder(pref_paths);

        start_logger(
            cli_args.debug.Matched() ? spdlog::level::debug : spdlog::level::info,
            args::get(cli_args.logfile),
            global_store::log_settings(prefs));

        auto pipeline = edit::EditPipeline(edit::EditCompiler(
            global_store::default_style(prefs), global_store::default_duration(prefs)));

        auto store = std::make_shared<session::FileSessionStore>(args::get(cli_args.store));
        sessions   = system.spawn<session::SessionActor>(store, pipeline);
    }

    ~Launcher() {
        scoped_actor self{system};
        self->send_exit(sessions, caf::exit_reason::user_shutdown);
    }

    caf::actor timeline(scoped_actor &self, const std::string &session_id) {
        return request_receive<caf::actor>(
            *self, sessions, session::get_session_atom_v, session_id);
    }

    int run() {
        scoped_actor self{system};

        if (cli_args.new_cmd) {
            std::string session_id;
            if (cli_args.new_session)
                session_id = request_receive<std::string>(
                    *self,
                    sessions,
                    session::create_session_atom_v,
                    args::get(cli_args.new_session));
            else
                session_id = request_receive<std::string>(
                    *self, sessions, session::create_session_atom_v);
            std::cout << session_id << std::endl;

        } else if (cli_args.sessions_cmd) {
            for (const auto &i : request_receive<std::vector<std::string>>(
                     *self, sessions, session::session_list_atom_v))
                std::cout << i << std::endl;

        } else if (cli_args.remove_cmd) {
            if (not request_receive<bool>(
                    *self,
                    sessions,
                    session::remove_session_atom_v,
                    args::get(cli_args.remove_session))) {
                spdlog::warn("No such session {}", args::get(cli_args.remove_session));
                return EXIT_FAILURE;
            }

        } else if (cli_args.edit_cmd) {
            auto tl     = timeline(self, args::get(cli_args.edit_session));
            auto result = request_receive<edit::EditResult>(
                *self,
                tl,
                edit::edit_atom_v,
                args::get(cli_args.edit_intent),
                args::get(cli_args.edit_params));

            JsonStore out;
            out["reply"]    = result.reply;
            out["result"]   = result.serialise();
            out["timeline"] = subtitle::serialise_subtitles(
                request_receive<subtitle::Subtitles>(*self, tl, subtitle::subtitles_atom_v));
            std::cout << out.dump(2) << std::endl;

        } else if (cli_args.show_cmd) {
            auto tl = timeline(self, args::get(cli_args.show_session));
            std::cout << request_receive<JsonStore>(*self, tl, serialise_atom_v).dump(2)
                      << std::endl;

        } else if (cli_args.cues_cmd) {
            auto tl = timeline(self, args::get(cli_args.cues_session));
            auto subtitles =
                request_receive<subtitle::Subtitles>(*self, tl, subtitle::subtitles_atom_v);
            std::cout << cue::serialise_cues(cue::make_cues(subtitles)).dump(2) << std::endl;

        } else if (cli_args.validate_cmd) {
            auto tl     = timeline(self, args::get(cli_args.validate_session));
            auto issues = request_receive<std::vector<std::string>>(
                *self, tl, subtitle::validate_atom_v);
            for (const auto &i : issues)
                std::cout << i << std::endl;
            if (not issues.empty())
                return EXIT_FAILURE;

        } else if (cli_args.clear_cmd) {
            auto tl = timeline(self, args::get(cli_args.clear_session));
            request_receive<bool>(*self, tl, subtitle::clear_atom_v);

        } else if (cli_args.compact_cmd) {
            auto intervals = parse_silence_args(args::get(cli_args.silence));
            if (cli_args.silence_log) {
                const auto parsed = silence::parse_silencedetect_log(
                    read_text_file(args::get(cli_args.silence_log)));
                intervals.insert(intervals.end(), parsed.begin(), parsed.end());
            }

            auto tl     = timeline(self, args::get(cli_args.compact_session));
            auto result = request_receive<silence::CompactResult>(
                *self,
                tl,
                silence::compact_atom_v,
                intervals,
                args::get(cli_args.duration));

            JsonStore out         = result.serialise();
            out["filter_complex"] = silence::build_filter_complex(result.keep);
            std::cout << out.dump(2) << std::endl;

        } else if (cli_args.detect_cmd) {
            std::cout << silence::silencedetect_filter(
                             global_store::noise_threshold(prefs),
                             global_store::min_silence_duration(prefs))
                      << std::endl;
        }

        return EXIT_SUCCESS;
    }

    CLIArguments &cli_args;
    actor_system &system;
    JsonStore prefs;
    caf::actor sessions;
};

} // namespace

int main(int argc, char **argv) {
    ACTOR_INIT_GLOBAL_META()
    caf::core::init_global_meta_objects();

    CLIArguments cli_args;
    cli_args.parse_args(argc, argv);

    int exit_code = EXIT_SUCCESS;

    try {
        caf::actor_system_config cfg;
        caf::actor_system system{cfg};

        try {
            Launcher l(cli_args, system);
            exit_code = l.run();
        } catch (const std::exception &err) {
            spdlog::error("{}", err.what());
            exit_code = EXIT_FAILURE;
        }

    } catch (const std::exception &err) {
        spdlog::critical("{} {}", __PRETTY_FUNCTION__, err.what());
        exit_code = EXIT_FAILURE;
    }

    stop_logger();
    return exit_code;
}
