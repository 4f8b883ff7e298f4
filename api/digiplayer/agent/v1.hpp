#pragma once

#include "digiplayer/agent/v1/content.pb.h"
#include "digiplayer/agent/v1/heartbeat.pb.h"
#include "digiplayer/agent/v1/registration.pb.h"
#include "digiplayer/agent/v1/status.pb.h"
