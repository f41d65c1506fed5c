#include <fstream>

#include "ctpn/RPN/util/rpn_utils.hpp"
#include "ctpn/RPN/rpn_head.hpp"

namespace ctpn {

namespace Rpn {

namespace fs = ::boost::filesystem;

// Every regular file under path (recursively) whose extension is ext, as
// full paths in lexicographic order. A missing directory yields no files.
vector<string> get_file_list(const string& path, const string& ext) {
  vector<string> files;
  const fs::path root(path);
  if (!fs::is_directory(root)) {
    LOG(WARNING) << "Not a directory : " << path;
    return files;
  }
  for (fs::recursive_directory_iterator entry(root), end; entry != end; ++entry) {
    const fs::path& current = entry->path();
    if (fs::is_regular_file(current) && current.extension().string() == ext) {
      files.push_back(current.string());
    }
  }
  std::sort(files.begin(), files.end());
  DLOG(INFO) << files.size() << " " << ext << " files under " << path;
  return files;
}

// One box per line.
template <typename Dtype>
string anchor_to_string(const vector<Box<Dtype> > &anchors) {
  std::ostringstream out;
  for (size_t i = 0; i < anchors.size(); i++) {
    out << anchors[i].to_string() << "\n";
  }
  return out.str();
}
template string anchor_to_string(const vector<Box<float> > &anchors);
template string anchor_to_string(const vector<Box<double> > &anchors);

string float_to_string(const vector<float> data) {
  vector<string> items;
  char buff[32];
  for (size_t i = 0; i < data.size(); i++) {
    snprintf(buff, sizeof(buff), "%.2f", data[i]);
    items.push_back(buff);
  }
  return boost::algorithm::join(items, ", ");
}

string float_to_string(const float *data, int n) {
  CHECK_GE(n, 0);
  return float_to_string(vector<float>(data, data + n));
}

template <typename Dtype>
bool load_rpn_dump(const string& path, bool with_gt, FeatureMap<Dtype>& feature_map,
                   ImageInfo<Dtype>& im_info, vector<GtBox<Dtype> >& gt_boxes) {
  std::ifstream infile(path.c_str());
  if (!infile.is_open()) {
    LOG(ERROR) << "Can not open " << path;
    return false;
  }
  int height, width, num_anchors;
  if (!(infile >> height >> width >> num_anchors >> im_info.height >> im_info.width >> im_info.scale)) {
    LOG(ERROR) << "Bad header in " << path;
    return false;
  }
  if (height <= 0 || width <= 0 || num_anchors <= 0) {
    LOG(ERROR) << "Illegal grid " << height << " x " << width << " x " << num_anchors << " in " << path;
    return false;
  }
  feature_map = FeatureMap<Dtype>(height, width, num_anchors);
  for (size_t i = 0; i < feature_map.cls_score.size(); i++) {
    if (!(infile >> feature_map.cls_score[i])) {
      LOG(ERROR) << "Truncated cls_score in " << path << " at " << i;
      return false;
    }
  }
  for (size_t i = 0; i < feature_map.bbox_pred.size(); i++) {
    if (!(infile >> feature_map.bbox_pred[i])) {
      LOG(ERROR) << "Truncated bbox_pred in " << path << " at " << i;
      return false;
    }
  }

  gt_boxes.clear();
  if (!with_gt) return true;
  int num_gt;
  if (!(infile >> num_gt) || num_gt < 0) {
    LOG(ERROR) << "Missing gt box count in " << path;
    return false;
  }
  for (int i = 0; i < num_gt; i++) {
    Dtype x1, y1, x2, y2;
    int label;
    if (!(infile >> x1 >> y1 >> x2 >> y2 >> label)) {
      LOG(ERROR) << "Truncated gt boxes in " << path << " at " << i;
      return false;
    }
    gt_boxes.push_back(GtBox<Dtype>(x1, y1, x2, y2, label));
  }
  return true;
}
template bool load_rpn_dump(const string& path, bool with_gt, FeatureMap<float>& feature_map,
                            ImageInfo<float>& im_info, vector<GtBox<float> >& gt_boxes);
template bool load_rpn_dump(const string& path, bool with_gt, FeatureMap<double>& feature_map,
                            ImageInfo<double>& im_info, vector<GtBox<double> >& gt_boxes);

} // namespace Rpn

} // namespace ctpn
