#pragma once

#define SPANDA_VERSION "0.3.1"
