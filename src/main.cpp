//
//  main.cpp
//
//  trackScope
//

#include "ofMain.h"
#include "ofApp.h"
#include <string>

int main(int argc, char* argv[]) {
    std::string trackPath;

    // First non-flag argument is the track to open
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            ofSetLogLevel(OF_LOG_VERBOSE);
        } else if (trackPath.empty()) {
            trackPath = arg;
        }
    }

    ofSetupOpenGL(1280, 720, OF_WINDOW);
    ofRunApp(new ofApp(trackPath));

    return 0;
}
