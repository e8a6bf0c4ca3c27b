#pragma once

#include "constellation_settings.hpp"

namespace constellation {

// Keys missing from the file keep their current value in st.
bool load_settings(const char* path, ConstellationSettings& st);
bool save_settings(const char* path, const ConstellationSettings& st);

}
