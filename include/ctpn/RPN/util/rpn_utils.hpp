// ------------------------------------------------------------------
// CTPN region proposal core : box types and shared helpers
// ------------------------------------------------------------------
#ifndef CTPN_RPN_UTILS_HPP_
#define CTPN_RPN_UTILS_HPP_

#include <cstdio>
#include <cstring>
#include <algorithm>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include "boost/filesystem.hpp"

#include <glog/logging.h>

#include "ctpn/common.hpp"

namespace ctpn {

namespace Rpn {

// Plain 4-vector : regression deltas, targets and loss weights.
template <typename Dtype>
class Point4f {
public:
  Dtype Point[4];
  Point4f(Dtype a = 0, Dtype b = 0, Dtype c = 0, Dtype d = 0) {
    Point[0] = a; Point[1] = b;
    Point[2] = c; Point[3] = d;
  }
  explicit Point4f(const Dtype data[4]) {
    for (int i = 0; i < 4; i++) Point[i] = data[i];
  }
  Point4f(const Point4f &other) { memcpy(Point, other.Point, sizeof(Point)); }
  Point4f &operator=(const Point4f &other) {
    memcpy(Point, other.Point, sizeof(Point));
    return *this;
  }
  Dtype& operator[](const unsigned int id) { return Point[id]; }
  const Dtype& operator[](const unsigned int id) const { return Point[id]; }

  string to_string() const {
    char buff[100];
    snprintf(buff, sizeof(buff), "%.4f %.4f %.4f %.4f", double(Point[0]),
             double(Point[1]), double(Point[2]), double(Point[3]));
    return string(buff);
  }
};

// Axis aligned box (x1, y1, x2, y2) in pixel-inclusive coordinates, i.e.
// width = x2 - x1 + 1. Read only once constructed.
template <typename Dtype>
class Box {
public:
  Box(Dtype x1 = 0, Dtype y1 = 0, Dtype x2 = 0, Dtype y2 = 0) {
    coords_[0] = x1; coords_[1] = y1;
    coords_[2] = x2; coords_[3] = y2;
  }
  Box(const Box &other) { memcpy(coords_, other.coords_, sizeof(coords_)); }
  Box &operator=(const Box &other) {
    memcpy(coords_, other.coords_, sizeof(coords_));
    return *this;
  }

  const Dtype& operator[](const unsigned int id) const { return coords_[id]; }
  Dtype x1() const { return coords_[0]; }
  Dtype y1() const { return coords_[1]; }
  Dtype x2() const { return coords_[2]; }
  Dtype y2() const { return coords_[3]; }
  Dtype width() const { return coords_[2] - coords_[0] + 1; }
  Dtype height() const { return coords_[3] - coords_[1] + 1; }
  Dtype ctr_x() const { return coords_[0] + Dtype(0.5) * width(); }
  Dtype ctr_y() const { return coords_[1] + Dtype(0.5) * height(); }
  Dtype area() const { return width() * height(); }

  string to_string() const {
    char buff[100];
    snprintf(buff, sizeof(buff), "%.1f %.1f %.1f %.1f", double(coords_[0]),
             double(coords_[1]), double(coords_[2]), double(coords_[3]));
    return string(buff);
  }

protected:
  Dtype coords_[4];
};

// A lattice box; index is its position in the anchor set.
template <typename Dtype>
class Anchor : public Box<Dtype> {
public:
  int index;
  Anchor(Dtype x1 = 0, Dtype y1 = 0, Dtype x2 = 0, Dtype y2 = 0, int index = -1)
      : Box<Dtype>(x1, y1, x2, y2), index(index) {}
  Anchor(const Box<Dtype> &box, int index_)
      : Box<Dtype>(box), index(index_) {}
};

// Ground truth box with its class label, rows of the N x 5 gt_boxes input.
template <typename Dtype>
class GtBox : public Box<Dtype> {
public:
  int label;
  GtBox(Dtype x1 = 0, Dtype y1 = 0, Dtype x2 = 0, Dtype y2 = 0, int label = 1)
      : Box<Dtype>(x1, y1, x2, y2), label(label) {}
  GtBox(const Box<Dtype> &box, int label_)
      : Box<Dtype>(box), label(label_) {}
};

template <typename Dtype>
class Proposal : public Box<Dtype> {
public:
  Dtype score;
  // anchor this proposal was decoded from, -1 for padding entries
  int anchor_index;

  Proposal(Dtype x1 = 0, Dtype y1 = 0, Dtype x2 = 0, Dtype y2 = 0,
           Dtype score = 0, int anchor_index = -1)
      : Box<Dtype>(x1, y1, x2, y2), score(score), anchor_index(anchor_index) {}
  Proposal(const Box<Dtype> &box, Dtype score_, int anchor_index_)
      : Box<Dtype>(box), score(score_), anchor_index(anchor_index_) {}

  // higher score first, then lower anchor index
  bool operator<(const Proposal &other) const {
    if (score != other.score)
      return score > other.score;
    else
      return anchor_index < other.anchor_index;
  }

  inline string to_string() const {
    char buff[120];
    snprintf(buff, sizeof(buff), "anchor:%6d -- (%.3f): %.2f %.2f %.2f %.2f",
             anchor_index, double(score), double(this->coords_[0]),
             double(this->coords_[1]), double(this->coords_[2]),
             double(this->coords_[3]));
    return string(buff);
  }
};

// im_info : network input height, width and the resize scale applied to
// the original image.
template <typename Dtype>
struct ImageInfo {
  Dtype height;
  Dtype width;
  Dtype scale;
  ImageInfo(Dtype height_ = 0, Dtype width_ = 0, Dtype scale_ = 1)
      : height(height_), width(width_), scale(scale_) {}
};

template <typename Dtype>
Dtype get_iou(const Box<Dtype> &A, const Box<Dtype> &B);

template <typename Dtype>
vector<Dtype> get_ious(const Box<Dtype> &A, const vector<Box<Dtype> > &B);

template <typename Dtype>
vector<vector<Dtype> > get_ious(const vector<Box<Dtype> > &A, const vector<Box<Dtype> > &B);

// config
typedef std::map<string, string> str_map;

str_map parse_json_config(const string file_path);

string extract_string(string target_key, str_map& default_map);
string extract_string(string target_key, const string& default_value, str_map& default_map);

float extract_float(string target_key, str_map& default_map);
float extract_float(string target_key, float default_value, str_map& default_map);

int extract_int(string target_key, str_map& default_map);
int extract_int(string target_key, int default_value, str_map& default_map);

vector<float> extract_vector(string target_key, str_map& default_map);
vector<float> extract_vector(string target_key, const vector<float>& default_value, str_map& default_map);

// file
vector<string> get_file_list(const string& path, const string& ext);

template <typename Dtype>
string anchor_to_string(const vector<Box<Dtype> > &anchors);

string float_to_string(const vector<float> data);

string float_to_string(const float *data, int n);

}  // namespace Rpn

}  // namespace ctpn

#endif  // CTPN_RPN_UTILS_HPP_
