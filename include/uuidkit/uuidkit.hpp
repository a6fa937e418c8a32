// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <uuidkit/bits.hpp>
#include <uuidkit/clock.hpp>
#include <uuidkit/config.hpp>
#include <uuidkit/context.hpp>
#include <uuidkit/digest.hpp>
#include <uuidkit/exception.hpp>
#include <uuidkit/generators.hpp>
#include <uuidkit/node.hpp>
#include <uuidkit/uuid.hpp>
