// SPDX-License-Identifier: Apache-2.0
#include <caf/all.hpp>

#include "cuecraft/atoms.hpp"
#include "cuecraft/session/session_actor.hpp"
#include "cuecraft/session/timeline_actor.hpp"
#include "cuecraft/utility/helpers.hpp"
#include "cuecraft/utility/logging.hpp"

using namespace cuecraft;
using namespace cuecraft::session;
using namespace cuecraft::utility;

SessionActor::SessionActor(
    caf::actor_config &cfg, std::shared_ptr<SessionStore> store, edit::EditPipeline pipeline)
    : caf::event_based_actor(cfg), store_(std::move(store)), pipeline_(std::move(pipeline)) {

    system().registry().put(session_registry, this);

    set_down_handler([=](caf::down_msg &msg) {
        for (auto it = timelines_.begin(); it != timelines_.end(); ++it) {
            if (msg.source == it->second) {
                demonitor(it->second);
                spdlog::debug("{} released {}", NAME, it->first);
                timelines_.erase(it);
                break;
            }
        }
    });

    print_on_create(this, NAME);
    print_on_exit(this, NAME);
}

void SessionActor::on_exit() {
    for (const auto &i : timelines_)
        send_exit(i.second, caf::exit_reason::user_shutdown);
    timelines_.clear();
    system().registry().erase(session_registry);
}

caf::actor SessionActor::timeline_actor(const std::string &session_id) {
    auto it = timelines_.find(session_id);
    if (it != timelines_.end())
        return it->second;

    auto actor = spawn<TimelineActor>(session_id, store_, pipeline_);
    monitor(actor);
    timelines_[session_id] = actor;
    return actor;
}

caf::message_handler SessionActor::message_handler() {
    return caf::message_handler{
        [=](create_session_atom) -> caf::result<std::string> {
            try {
                auto session_id = generate_session_id();
                while (store_->contains(session_id))
                    session_id = generate_session_id();
                store_->put(session_id, subtitle::Subtitles());
                spdlog::info("Created session {}", session_id);
                return session_id;
            } catch (const std::exception &err) {
                return to_caf_error(err);
            }
        },

        [=](create_session_atom, const std::string &session_id) -> caf::result<std::string> {
            try {
                if (not store_->contains(session_id)) {
                    store_->put(session_id, subtitle::Subtitles());
                    spdlog::info("Created session {}", session_id);
                }
                return session_id;
            } catch (const std::exception &err) {
                return to_caf_error(err);
            }
        },

        [=](get_session_atom, const std::string &session_id) -> caf::result<caf::actor> {
            try {
                if (not timelines_.count(session_id) and not store_->contains(session_id))
                    return caf::make_error(
                        cuecraft_error::session_missing,
                        std::string("No such session ") + session_id);
                return timeline_actor(session_id);
            } catch (const std::exception &err) {
                return to_caf_error(err);
            }
        },

        [=](session_list_atom) -> caf::result<std::vector<std::string>> {
            try {
                return store_->keys();
            } catch (const std::exception &err) {
                return to_caf_error(err);
            }
        },

        [=](remove_session_atom, const std::string &session_id) -> caf::result<bool> {
            try {
                auto it = timelines_.find(session_id);
                if (it != timelines_.end()) {
                    demonitor(it->second);
                    send_exit(it->second, caf::exit_reason::user_shutdown);
                    timelines_.erase(it);
                }
                return store_->erase(session_id);
            } catch (const std::exception &err) {
                return to_caf_error(err);
            }
        }};
}
