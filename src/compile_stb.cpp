// ============================================================================
//  File: src/compile_stb.cpp — Unité de compilation unique pour stb
// ============================================================================
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#define STBI_ONLY_PNG
#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable: 4244 4996)
#endif
#include "stb_image.h"
#include "stb_image_write.h"
#if defined(_MSC_VER)
#pragma warning(pop)
#endif
