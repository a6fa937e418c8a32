// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#ifdef _MSC_VER
#ifdef UUIDKIT_EXPORTS
#define UUIDKIT_API __declspec(dllexport)
#else
#define UUIDKIT_API __declspec(dllimport)
#endif
#else
#if defined(__GNUC__) || defined(__clang__)
#define UUIDKIT_API __attribute__((visibility("default")))
#else
#define UUIDKIT_API
#endif
#endif
