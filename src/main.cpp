/**
 * @file    main.cpp
 * @brief   Cursor Removal Tool - CLI Entry Point
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Removes a moving mouse cursor from screen recordings.
 *
 * Pipeline:
 *   detect  -> multi-scale template matching against a dataset of cursor crops
 *   correct -> reject false positives, mark cursor-free frames, guide by point
 *   mask    -> trueform shape or dilated box per frame
 *   inpaint -> temporal fill from similar frames, classical inpaint fallback
 *   export  -> mask video and final video
 *
 * All results are cached per frame under cursor_cache/<video-stem>/, so every
 * step can be interrupted and resumed.
 *
 * Usage:
 *   CursorRemovalTool detect  --video rec.mp4 --dataset cursors/
 *   CursorRemovalTool reject  --video rec.mp4 --frame 120 --bbox 400,300,32,32
 *   CursorRemovalTool inpaint --video rec.mp4 --inpaint temporal
 *   CursorRemovalTool export-inpaint --video rec.mp4 -o clean.mp4
 */

#include "cli/cli_app.hpp"

int main(int argc, char** argv) {
    return cre::cli::run(argc, argv);
}
