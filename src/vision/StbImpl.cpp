// SPDX-License-Identifier: Apache-2.0

// Single translation unit for the stb_image and stb_image_write implementations.
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image.h>
#include <stb_image_write.h>
