// SPDX-License-Identifier: Apache-2.0

// Single translation unit for the miniaudio implementation.
// This file must be compiled exactly once. AudioFileReader and the tests include
// <miniaudio.h> without the IMPLEMENTATION define. MA_NO_DEVICE_IO is set by the build
// for every translation unit, since vadkit never opens an audio device.
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
