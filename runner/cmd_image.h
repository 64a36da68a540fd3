#pragma once

int cmd_image(int argc, char** argv);
