// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#include "bootloader.hpp"

int main(int argc, const char **argv) {
  BootLoader::plug(argc, argv);
  BootLoader::boot();

  auto rc = BootLoader::run();

  BootLoader::unboot();
  BootLoader::unplug();

  return rc;
}
