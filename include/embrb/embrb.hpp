// SPDX-License-Identifier: BSL-1.0
// SPDX-FileCopyrightText: Copyright 2024-2025 Kasumi Hanazuki <kasumi@rollingapple.net>
#pragma once

#include <embrb/internal/embrb.hpp>
#include <embrb/internal/embrb_impl.hpp>
