/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#if defined(_WIN32) && defined(BIM_SHARED_LIBS)
#ifdef BIM_CORE_EXPORTS
#define BIM_CORE_API __declspec(dllexport)
#else
#define BIM_CORE_API __declspec(dllimport)
#endif
#elif defined(BIM_SHARED_LIBS)
#define BIM_CORE_API __attribute__((visibility("default")))
#else
#define BIM_CORE_API
#endif

#define BIM_LOGGER_API BIM_CORE_API
