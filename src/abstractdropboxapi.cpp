/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "abstractdropboxapi.h"

AbstractDropboxApi::~AbstractDropboxApi() = default;
