// SPDX-License-Identifier: Apache-2.0
#include <caf/all.hpp>

#include "cuecraft/atoms.hpp"
#include "cuecraft/session/timeline_actor.hpp"
#include "cuecraft/silence/silence_compactor.hpp"
#include "cuecraft/utility/helpers.hpp"
#include "cuecraft/utility/logging.hpp"

using namespace cuecraft;
using namespace cuecraft::session;
using namespace cuecraft::subtitle;
using namespace cuecraft::utility;

TimelineActor::TimelineActor(
    caf::actor_config &cfg,
    std::string session_id,
    std::shared_ptr<SessionStore> store,
    edit::EditPipeline pipeline)
    : caf::event_based_actor(cfg),
      session_id_(std::move(session_id)),
      store_(std::move(store)),
      pipeline_(std::move(pipeline)) {

    if (auto stored = store_->get(session_id_))
        base_ = Timeline(*stored);

    print_on_create(this, NAME + " " + session_id_);
    print_on_exit(this, NAME + " " + session_id_);
}

void TimelineActor::commit(const Timeline &previous) {
    try {
        store_->put(session_id_, base_.subtitles());
    } catch (const std::exception &err) {
        spdlog::warn("{} {} {}", __PRETTY_FUNCTION__, session_id_, err.what());
        base_ = previous;
        throw;
    }
}

caf::message_handler TimelineActor::message_handler() {
    return caf::message_handler{
        [=](utility::name_atom) -> std::string { return session_id_; },

        [=](subtitles_atom) -> Subtitles { return base_.subtitles(); },

        [=](chronological_atom) -> Subtitles { return base_.chronological(); },

        [=](validate_atom) -> std::vector<std::string> { return base_.validate(); },

        [=](utility::serialise_atom) -> JsonStore {
            JsonStore jsn;
            jsn["session_id"] = session_id_;
            jsn["timeline"]   = base_.serialise();
            return jsn;
        },

        [=](replace_atom, const Subtitles &subtitles) -> caf::result<size_t> {
            const auto previous = base_;
            try {
                const auto kept = base_.replace(subtitles);
                commit(previous);
                return kept;
            } catch (const std::exception &err) {
                return to_caf_error(err);
            }
        },

        [=](clear_atom) -> caf::result<bool> {
            const auto previous = base_;
            try {
                base_.clear();
                commit(previous);
                spdlog::info("Cleared subtitles of {}", session_id_);
                return true;
            } catch (const std::exception &err) {
                return to_caf_error(err);
            }
        },

        [=](edit::edit_atom, const std::string &intent, const std::string &raw_params)
            -> caf::result<edit::EditResult> {
            const auto previous = base_;
            try {
                auto result = pipeline_.run(edit::OracleReply{intent, raw_params}, base_);
                if (result.changed())
                    commit(previous);
                return result;
            } catch (const std::exception &err) {
                spdlog::debug("{} {} {}", __PRETTY_FUNCTION__, session_id_, err.what());
                return to_caf_error(err);
            }
        },

        [=](edit::edit_atom, const std::string &intent, const JsonStore &params)
            -> caf::result<edit::EditResult> {
            const auto previous = base_;
            try {
                auto result = pipeline_.run(
                    edit::normalise_intent(intent), edit::EditParams::from_json(params), base_);
                if (result.changed())
                    commit(previous);
                return result;
            } catch (const std::exception &err) {
                spdlog::debug("{} {} {}", __PRETTY_FUNCTION__, session_id_, err.what());
                return to_caf_error(err);
            }
        },

        [=](silence::compact_atom,
            const silence::SilenceIntervals &intervals,
            const double total_duration) -> caf::result<silence::CompactResult> {
            START_SLOW_WATCHER()
            const auto previous = base_;
            try {
                auto result = silence::compact(intervals, total_duration, base_.subtitles());
                base_.replace(result.subtitles);
                commit(previous);

                result.subtitles = base_.subtitles();
                result.dropped   = previous.size() - base_.size();
                spdlog::info(
                    "Compacted {} keeping {} of {} subtitles",
                    session_id_,
                    base_.size(),
                    previous.size());
                CHECK_SLOW_WATCHER()
                return result;
            } catch (const std::exception &err) {
                return to_caf_error(err);
            }
        },

        [=](history_atom) -> ChatHistory { return history_; },

        [=](history_atom, const std::string &role, const std::string &content) -> bool {
            history_.emplace_back(role, content);
            return true;
        }};
}
