// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <map>
#include <memory>
#include <string>

#include <caf/all.hpp>

#include "cuecraft/edit/edit_pipeline.hpp"
#include "cuecraft/session/session_store.hpp"

namespace cuecraft {
namespace session {

    /*! Registry of editing sessions.

        Hands out one TimelineActor per session id, spawned on first use and
        dropped again when it exits. Registered under session_registry.
    */
    class SessionActor : public caf::event_based_actor {
      public:
        SessionActor(
            caf::actor_config &cfg,
            std::shared_ptr<SessionStore> store,
            edit::EditPipeline pipeline = edit::EditPipeline());
        ~SessionActor() override = default;

        const char *name() const override { return NAME.c_str(); }
        void on_exit() override;

      private:
        inline static const std::string NAME = "SessionActor";

        caf::message_handler message_handler();

        caf::behavior make_behavior() override { return message_handler(); }

        caf::actor timeline_actor(const std::string &session_id);

      private:
        std::shared_ptr<SessionStore> store_;
        edit::EditPipeline pipeline_;
        std::map<std::string, caf::actor> timelines_;
    };

} // namespace session
} // namespace cuecraft
