// SPDX-License-Identifier: Apache-2.0
#pragma once

namespace cuecraft {
namespace subtitle {

    typedef enum { SP_TOP = 0, SP_CENTER, SP_BOTTOM } SubtitlePosition;

    typedef enum { MK_NONE = 0, MK_INSERT, MK_UPDATE } MutationKind;

} // namespace subtitle
} // namespace cuecraft
