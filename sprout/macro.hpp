/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Common macros used across sprout

**************************************************/

#ifndef SPROUT_MACRO_HPP
#define SPROUT_MACRO_HPP

#define SPROUT_FILE_NAME __FILE__
#define SPROUT_FILE_LINE __LINE__

#if defined(__GNUC__) || defined(__clang__)
#define SPROUT_FUNC_NAME __PRETTY_FUNCTION__
#elif defined(_MSC_VER)
#define SPROUT_FUNC_NAME __FUNCSIG__
#else
#define SPROUT_FUNC_NAME __func__
#endif

#endif  // SPROUT_MACRO_HPP
