#pragma once

#include "usb_tree/device_path.hpp"
#include "usb_tree/device_tree.hpp"
#include "usb_tree/error.hpp"
#include "usb_tree/port_trie.hpp"
#include "usb_tree/tree_formatter.hpp"
#include "usb_tree/tree_style.hpp"
#include "usb_tree/usb_device.hpp"
