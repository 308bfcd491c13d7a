// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <npbridge/abi.h>
#include <npbridge/call.hpp>
#include <npbridge/config.hpp>
#include <npbridge/converter.hpp>
#include <npbridge/exception.hpp>
#include <npbridge/executor.hpp>
#include <npbridge/future.hpp>
#include <npbridge/metadata.hpp>
#include <npbridge/object.hpp>
