//
//  deps_sokol.cpp
//  aberred
//
//  Created by the aberred authors on 17/10/2025.
//

#define SOKOL_IMPL
#include "sokol/sokol_gfx.h"
#include "sokol/sokol_app.h"
#include "sokol/sokol_glue.h"
#include "sokol/sokol_log.h"
#include "sokol/sokol_time.h"
#include "sokol/sokol_audio.h"
#include "sokol/util/sokol_debugtext.h"
#define SOKOL_GP_IMPL
#include "sokol_gp.h"
