/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <peergen/internal/types.h>
#include <peergen/internal/errors.h>
#include <peergen/internal/logger.h>
#include <peergen/internal/payload.h>
#include <peergen/literal.h>
#include <peergen/dispatch_table.h>
#include <peergen/transport.h>
#include <peergen/peer.h>
