/*
 * File: src/glasses_main.cpp
 * Project: Glasses Controller
 * Purpose: glasses_stream: connect, stream live gaze data, print it once per second
 * Notes:
 *  - No --address: the glasses are discovered over IPv6 multicast
 *  - --bounds xlo xhi ylo yhi rings the terminal bell when gaze leaves the box
 * Last updated: 2026-10-18
 */

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "glasses/config.hpp"
#include "glasses/controller.hpp"
#include "glasses/errors.hpp"
#include "glasses/log.hpp"

struct Bounds
{
    double x_lower, x_upper, y_lower, y_upper;
};

int main(int argc, char **argv)
{
    int seconds = 10;
    std::optional<Bounds> bounds;
    ControllerConfig cfg;
    try
    {
        cfg = parse_config_args(argc, argv);
        for (int i = 1; i < argc; ++i)
        {
            std::string a = argv[i];
            if (a == "--seconds" && i + 1 < argc)
                seconds = std::stoi(argv[++i]);
            else if (a == "--bounds" && i + 4 < argc)
            {
                Bounds b{};
                b.x_lower = std::stod(argv[++i]);
                b.x_upper = std::stod(argv[++i]);
                b.y_lower = std::stod(argv[++i]);
                b.y_upper = std::stod(argv[++i]);
                bounds = b;
            }
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "glasses_stream: bad arguments: " << e.what() << "\n";
        return 1;
    }

    try
    {
        GlassesController glasses{cfg};
        std::cout << "glasses at " << glasses.base_url() << "\n";
        std::cout << glasses.get_battery_info() << "\n";
        std::cout << glasses.get_storage_info() << "\n";

        glasses.start_streaming();
        std::cout << "Please wait ...\n";
        std::this_thread::sleep_for(std::chrono::seconds(3));

        for (int i = 0; i < seconds && glasses.is_streaming(); ++i)
        {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            Sample gp = glasses.get_sample(Channel::gaze_point);
            if (!gp.has_data() || gp.values.size() < 2)
            {
                std::cout << "[" << i << "] no gaze point yet\n";
                continue;
            }
            const double x = gp.values[0];
            const double y = gp.values[1];
            std::cout << "[" << i << "] gaze x=" << x << " y=" << y << " ts=" << static_cast<long long>(gp.ts) << "\n";
            if (bounds)
            {
                if (x > bounds->x_upper || x < bounds->x_lower)
                    std::cout << "X out of bounds\a\n";
                else if (y > bounds->y_upper || y < bounds->y_lower)
                    std::cout << "Y out of bounds\a\n";
                else
                    std::cout << "In bounds\n";
            }
        }
        std::cout << "Gaze Position 3D: " << glasses.get_data().at(Channel::gaze_point_3d).message.dump() << "\n";

        glasses.stop_streaming();
        glasses.close();
        return 0;
    }
    catch (const DiscoveryUnavailable &e)
    {
        log_error(e.what(), "; pass --address explicitly");
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "glasses_stream error: " << e.what() << "\n";
        return 1;
    }
}
