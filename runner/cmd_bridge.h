#pragma once

int cmd_bridge(int argc, char** argv, int first_arg);
