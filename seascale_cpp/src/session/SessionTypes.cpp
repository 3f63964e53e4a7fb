/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "session/SessionTypes.h"

namespace SEASCALE::Session
{
const char* SessionKindName(SessionKind kind)
{
  switch (kind)
  {
    case SessionKind::Base:
      return "base";
    case SessionKind::Final:
      return "final";
    case SessionKind::Continuous:
      return "continuous";
    default:
      break;
  }

  return "unknown";
}
} // namespace SEASCALE::Session
