// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

// C view of the boundary. Safe to include from C and from foreign-language
// header importers.

#pragma once

#include <stdint.h>

#include <npbridge/export.hpp>

#ifdef __cplusplus
extern "C" {
#endif

// Byte buffer allocated by the runtime. Whoever receives one owns it and
// either passes it back across the boundary or frees it with
// npbridge_buffer_free.
typedef struct npbridge_buffer {
  uint64_t capacity;
  uint64_t len;
  uint8_t* data;
} npbridge_buffer;

enum npbridge_call_code {
  NPBRIDGE_CALL_SUCCESS = 0,
  NPBRIDGE_CALL_TYPED_ERROR = 1,
  NPBRIDGE_CALL_UNRECOVERABLE_FAULT = 2
};

// Out-of-band status cell passed to every boundary entry.
// payload holds the lowered error on NPBRIDGE_CALL_TYPED_ERROR and a UTF-8
// diagnostic on NPBRIDGE_CALL_UNRECOVERABLE_FAULT; it is empty on success.
typedef struct npbridge_call_status {
  int8_t code;
  npbridge_buffer payload;
} npbridge_call_status;

typedef uint64_t npbridge_object_handle;

// One in-flight asynchronous invocation. Opaque to the foreign side.
typedef struct npbridge_future npbridge_future;

// Invoked at most once per registration, from whatever thread finished the
// native computation. May re-enter the poll entry.
typedef void (*npbridge_completion_callback)(void* env);

NPBRIDGE_API npbridge_buffer npbridge_buffer_alloc(uint64_t size,
                                                   npbridge_call_status* status);
NPBRIDGE_API npbridge_buffer npbridge_buffer_from_bytes(
    const uint8_t* data, uint64_t len, npbridge_call_status* status);
NPBRIDGE_API npbridge_buffer npbridge_buffer_reserve(
    npbridge_buffer buf, uint64_t additional, npbridge_call_status* status);
NPBRIDGE_API void npbridge_buffer_free(npbridge_buffer buf,
                                       npbridge_call_status* status);

NPBRIDGE_API void npbridge_object_acquire(npbridge_object_handle handle,
                                          npbridge_call_status* status);
NPBRIDGE_API void npbridge_object_release(npbridge_object_handle handle,
                                          npbridge_call_status* status);

NPBRIDGE_API uint32_t npbridge_metadata_version(void);
NPBRIDGE_API uint32_t npbridge_metadata_count(npbridge_call_status* status);
NPBRIDGE_API npbridge_buffer npbridge_metadata_get(uint32_t index,
                                                   npbridge_call_status* status);
// Returns an empty buffer when no export matches.
NPBRIDGE_API npbridge_buffer npbridge_metadata_find(
    npbridge_buffer module, npbridge_buffer name, npbridge_call_status* status);

#ifdef __cplusplus
} // extern "C"
#endif
