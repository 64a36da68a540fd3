#pragma once

int cmd_profile(int argc, char** argv);
