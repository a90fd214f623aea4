// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <caf/all.hpp>

#include "cuecraft/edit/edit_pipeline.hpp"
#include "cuecraft/session/session_store.hpp"
#include "cuecraft/subtitle/timeline.hpp"

namespace cuecraft {
namespace session {

    using ChatHistory = std::vector<std::pair<std::string, std::string>>;

    /*! Owns the timeline of one session.

        The mailbox serialises every change to the session, each committed change is
        written back to the store before the reply is sent. A change the store
        refuses is rolled back.
    */
    class TimelineActor : public caf::event_based_actor {
      public:
        TimelineActor(
            caf::actor_config &cfg,
            std::string session_id,
            std::shared_ptr<SessionStore> store,
            edit::EditPipeline pipeline = edit::EditPipeline());
        ~TimelineActor() override = default;

        const char *name() const override { return NAME.c_str(); }

      private:
        inline static const std::string NAME = "TimelineActor";

        caf::message_handler message_handler();

        caf::behavior make_behavior() override { return message_handler(); }

        // store the current timeline, restore previous on failure and rethrow
        void commit(const subtitle::Timeline &previous);

      private:
        std::string session_id_;
        std::shared_ptr<SessionStore> store_;
        edit::EditPipeline pipeline_;
        subtitle::Timeline base_;
        ChatHistory history_;
    };

} // namespace session
} // namespace cuecraft
