// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#ifdef _MSC_VER
#ifdef NPBRIDGE_EXPORTS
#define NPBRIDGE_API __declspec(dllexport)
#else
#define NPBRIDGE_API __declspec(dllimport)
#endif
#define NPBRIDGE_EXPORT_ATTR __declspec(dllexport)
#define NPBRIDGE_IMPORT_ATTR __declspec(dllimport)
#else
#if defined(__GNUC__) || defined(__clang__)
#define NPBRIDGE_API __attribute__((visibility("default")))
#define NPBRIDGE_EXPORT_ATTR __attribute__((visibility("default")))
#define NPBRIDGE_IMPORT_ATTR __attribute__((visibility("default")))
#else
#define NPBRIDGE_API
#define NPBRIDGE_EXPORT_ATTR
#define NPBRIDGE_IMPORT_ATTR
#endif
#endif
