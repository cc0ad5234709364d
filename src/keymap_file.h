#pragma once

#include <string>

#include "hid.h"

// Read a whole keymap file as raw bytes. No format validation.
// Throws std::runtime_error if the file cannot be opened or read.
Bytes read_keymap_file(const std::string& path);

// Write raw keymap bytes, replacing any existing file.
// Throws std::runtime_error if the file cannot be created or written.
void write_keymap_file(const std::string& path, const Bytes& keymap);
