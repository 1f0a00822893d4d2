// main.cpp
#include "types.hpp"
#include "refinement.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <filesystem>
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using clk = std::chrono::high_resolution_clock;

static void usage() {
    std::cout << "usage: particle_seg <image> --pick x,y [--pick x,y ...]\n"
                 "       [--tol h,s,v] [--min-area N] [--scale len_per_px] [--no-auto-tol]\n"
                 "       [--cut x,y;x,y;...@radius ...] [--preview out.png] [--viewport WxH]\n"
                 "       [--connectivity 4|8] [--debug]\n";
}

static bool parse_doubles(const std::string& s, char sep, std::vector<double>& out) {
    out.clear();
    std::stringstream ss(s);
    std::string tok;
    while (std::getline(ss, tok, sep)) {
        try { out.push_back(std::stod(tok)); }
        catch (const std::exception&) { return false; }
    }
    return !out.empty();
}

// "x,y;x,y;...@r"
static bool parse_cut(const std::string& s, std::vector<cv::Point2d>& pts, double& radius) {
    pts.clear();
    radius = 1.0;
    std::string path = s;
    size_t at = s.find('@');
    if (at != std::string::npos) {
        path = s.substr(0, at);
        try { radius = std::stod(s.substr(at + 1)); }
        catch (const std::exception&) { return false; }
    }
    std::stringstream ss(path);
    std::string tok;
    std::vector<double> xy;
    while (std::getline(ss, tok, ';')) {
        if (!parse_doubles(tok, ',', xy) || xy.size() != 2) return false;
        pts.emplace_back(xy[0], xy[1]);
    }
    return !pts.empty();
}

static void emit_result(const std::string& name, const SegmentationResult& r, const CoverageStats& st,
                        double scale, bool debug_mode) {
    const char* unit = scale > 0 ? "units^2" : "px^2";
    if (r.status != SegStatus::OK) {
        std::cout << name << " no particles found (" << status_to_cstr(r.status) << ")\n";
        return;
    }
    for (const auto& p : r.particles) {
        std::cout << p.rank << " " << to_calibrated(p.area, scale);
        if (debug_mode) std::cout << " px=" << p.area << " at (" << p.centroid.x << "," << p.centroid.y << ")";
        std::cout << "\n";
    }
    std::cout << "\nSummary: " << name
              << " particles=" << st.count
              << " total=" << (double)st.total_area_px * st.unit_factor << " " << unit
              << " coverage=" << st.coverage * 100.0 << "%"
              << " mean=" << st.mean << " std=" << st.stddev
              << " min=" << st.min << " max=" << st.max << std::endl;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }

    std::string image_path, preview_path;
    std::vector<cv::Point> picks;
    std::vector<std::pair<std::vector<cv::Point2d>, double>> cuts;
    cv::Size viewport(800, 600);
    SessionParams sp;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](std::string& v) {
            if (i + 1 >= argc) { std::cerr << a << " needs a value\n"; return false; }
            v = argv[++i];
            return true;
        };
        std::string v;
        std::vector<double> nums;
        if (a == "--debug") { sp.debug = true; continue; }
        if (a == "--no-auto-tol") { sp.auto_tolerance = false; continue; }
        if (a == "--pick") {
            if (!next(v) || !parse_doubles(v, ',', nums) || nums.size() != 2) { usage(); return 1; }
            picks.emplace_back((int)nums[0], (int)nums[1]);
        }
        else if (a == "--tol") {
            if (!next(v) || !parse_doubles(v, ',', nums) || nums.size() != 3) { usage(); return 1; }
            sp.tolerances.hue = nums[0]; sp.tolerances.sat = nums[1]; sp.tolerances.val = nums[2];
            sp.auto_tolerance = false; // explicit tolerances win
        }
        else if (a == "--min-area") {
            if (!next(v) || !parse_doubles(v, ',', nums) || nums.size() != 1) { usage(); return 1; }
            sp.tolerances.min_area = std::max(0, (int)nums[0]);
        }
        else if (a == "--scale") {
            if (!next(v) || !parse_doubles(v, ',', nums) || nums.size() != 1) { usage(); return 1; }
            sp.scale = nums[0];
        }
        else if (a == "--connectivity") {
            if (!next(v) || (v != "4" && v != "8")) { usage(); return 1; }
            sp.segmentation.connectivity = std::stoi(v);
        }
        else if (a == "--cut") {
            std::vector<cv::Point2d> pts; double r = 1.0;
            if (!next(v) || !parse_cut(v, pts, r)) { usage(); return 1; }
            cuts.emplace_back(pts, r);
        }
        else if (a == "--preview") {
            if (!next(v)) { usage(); return 1; }
            preview_path = v;
        }
        else if (a == "--viewport") {
            if (!next(v) || !parse_doubles(v, 'x', nums) || nums.size() != 2) { usage(); return 1; }
            viewport = cv::Size((int)nums[0], (int)nums[1]);
        }
        else if (image_path.empty()) {
            if (std::filesystem::exists(a)) image_path = a;
            else { std::cerr << a << " is not a valid picture path\n"; return 1; }
        }
        else {
            std::cerr << "unexpected argument " << a << "\n";
            usage();
            return 1;
        }
    }
    if (image_path.empty()) { usage(); return 1; }

    auto t0 = clk::now();

    cv::Mat bgr = cv::imread(image_path, cv::IMREAD_COLOR);
    if (bgr.empty()) {
        std::cerr << image_path << " could not be decoded\n";
        return 1;
    }
    cv::Mat rgb; cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);

    // seed colors, clamped into the image like any operator pick
    std::vector<cv::Vec3b> seeds;
    for (auto p : picks) {
        p.x = std::min(std::max(p.x, 0), rgb.cols - 1);
        p.y = std::min(std::max(p.y, 0), rgb.rows - 1);
        seeds.push_back(rgb.at<cv::Vec3b>(p));
    }
    if (seeds.empty()) std::cerr << "[warn] no --pick given, nothing will match\n";

    RefinementSession session(rgb, seeds, sp);
    auto now = SessionClock::now();
    for (const auto& c : cuts)
        if (!session.add_stroke(c.first, c.second, now))
            std::cerr << "[warn] cut stroke ignored, no finite point or radius\n";
    session.flush();

    emit_result(image_path, session.result(), session.stats(), sp.scale, sp.debug);

    if (!preview_path.empty()) {
        cv::Mat view = session.render(viewport);
        cv::Mat out; cv::cvtColor(view, out, cv::COLOR_RGB2BGR);
        if (!cv::imwrite(preview_path, out)) {
            std::cerr << preview_path << " could not be written\n";
            return 1;
        }
        if (sp.debug) std::cout << "[preview] wrote " << preview_path << "\n";
    }

    if (sp.debug) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(clk::now() - t0).count();
        std::cout << image_path << " took " << ms << " ms\n";
    }
    return 0;
}
