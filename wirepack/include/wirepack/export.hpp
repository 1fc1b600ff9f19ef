// Copyright (c) 2025 The Wirepack Authors
#pragma once

#if defined(_WIN32)
#if defined(WIREPACK_BUILDING_DLL)
#define WIREPACK_API __declspec(dllexport)
#elif defined(WIREPACK_SHARED)
#define WIREPACK_API __declspec(dllimport)
#else
#define WIREPACK_API
#endif
#else
#define WIREPACK_API
#endif
