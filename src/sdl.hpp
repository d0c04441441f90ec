#pragma once

// The window frontend owns main() itself, so SDL must not rename it to
// SDL_main. main.cpp calls SDL_SetMainReady() before SDL_Init().
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>
